/**
 * @file service_daemon.cpp
 * @brief Human-readable event descriptions for debug logging.
 */

#include "transport/service_daemon.hpp"

#include <type_traits>

namespace server_browser {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string join_addresses(const AddressSet& addresses) {
    std::string out = "[";
    bool first = true;
    for (const auto& address : addresses) {
        if (!first) out += ", ";
        first = false;
        out += address;
    }
    out += ']';
    return out;
}

}  // anonymous namespace

std::string describe(const ServiceEvent& event) {
    return std::visit(overloaded{
        [](const SearchStarted& e) { return "SearchStarted(" + e.service_type + ")"; },
        [](const ServiceFound& e) {
            return "ServiceFound(" + e.service_type + ", " + e.fullname + ")";
        },
        [](const ServiceResolved& e) {
            return "ServiceResolved(" + e.info.fullname() + ", host=" + e.info.hostname
                   + ", port=" + std::to_string(e.info.port)
                   + ", addresses=" + join_addresses(e.info.addresses)
                   + ", properties=" + e.info.properties.to_string() + ")";
        },
        [](const ServiceRemoved& e) {
            return "ServiceRemoved(" + e.service_type + ", " + e.fullname + ")";
        },
        [](const SearchStopped& e) { return "SearchStopped(" + e.service_type + ")"; },
    }, event);
}

std::string describe(const DaemonEvent& event) {
    return std::visit(overloaded{
        [](const Announce& e) { return "Announce(" + e.fullname + ", " + e.interface + ")"; },
        [](const DaemonError& e) { return "Error(" + e.message + ")"; },
        [](const IpAdded& e) { return "IpAdd(" + e.address + ")"; },
        [](const IpRemoved& e) { return "IpDel(" + e.address + ")"; },
    }, event);
}

}  // namespace server_browser
