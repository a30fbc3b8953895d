/**
 * @file server_list.cpp
 * @brief ServerList lookups and DiscoveredServer formatting.
 */

#include "discovery/server_list.hpp"

namespace server_browser {

std::string DiscoveredServer::to_string() const {
    std::string out = "DiscoveredServer { hostname: \"" + hostname + "\", port: "
                      + std::to_string(port) + ", addresses: {";
    bool first = true;
    for (const auto& address : addresses) {
        if (!first) out += ", ";
        first = false;
        out += address;
    }
    out += "}, metadata: " + metadata.to_string() + " }";
    return out;
}

bool ServerList::contains(const ServiceFullname& key) const {
    return servers_.count(key) > 0;
}

const DiscoveredServer* ServerList::find(const ServiceFullname& key) const {
    auto it = servers_.find(key);
    return it == servers_.end() ? nullptr : &it->second;
}

}  // namespace server_browser
