/**
 * @file server_list.hpp
 * @brief Discovered servers and the read-only collection exposed to the host.
 */

#pragma once

#include "core/types.hpp"
#include "discovery/server_metadata.hpp"

#include <cstddef>
#include <iterator>
#include <string>
#include <unordered_map>

namespace server_browser {

/**
 * @brief A server seen on the local network.
 *
 * The fully-qualified instance name is not stored here: it is only the
 * deduplication key of the ServerList. Two servers are equal when hostname,
 * port, addresses and metadata are all equal.
 */
struct DiscoveredServer {
    /// Hostname of the machine the server runs on, without ".local.".
    /// Useful to tell apart servers that share a user-facing name.
    std::string hostname;

    /// Port the server reported; nothing is bound or connected by this library.
    Port port{0};

    /// Addresses the server is reachable on; try them in order.
    AddressSet addresses;

    ServerMetadata metadata;

    bool operator==(const DiscoveredServer&) const = default;

    [[nodiscard]] std::string to_string() const;
};

class PeerReconciler;

/**
 * @brief All servers discovered by the current search.
 *
 * Read-only outside PeerReconciler. Iteration yields DiscoveredServer in the
 * container's order, which is unspecified but does not change while nobody
 * runs a host cycle.
 */
class ServerList {
    using Storage = std::unordered_map<ServiceFullname, DiscoveredServer>;

public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = DiscoveredServer;
        using difference_type = std::ptrdiff_t;
        using pointer = const DiscoveredServer*;
        using reference = const DiscoveredServer&;

        const_iterator() = default;
        explicit const_iterator(Storage::const_iterator it) : it_(it) {}

        reference operator*() const { return it_->second; }
        pointer operator->() const { return &it_->second; }

        const_iterator& operator++() {
            ++it_;
            return *this;
        }
        const_iterator operator++(int) {
            auto copy = *this;
            ++it_;
            return copy;
        }

        /// Deduplication key of the current entry.
        [[nodiscard]] const ServiceFullname& key() const { return it_->first; }

        bool operator==(const const_iterator&) const = default;

    private:
        Storage::const_iterator it_{};
    };

    [[nodiscard]] bool is_empty() const noexcept { return servers_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return servers_.size(); }

    [[nodiscard]] const_iterator begin() const noexcept { return const_iterator{servers_.cbegin()}; }
    [[nodiscard]] const_iterator end() const noexcept { return const_iterator{servers_.cend()}; }

    [[nodiscard]] bool contains(const ServiceFullname& key) const;

    /// Pointer into the list, valid until the next host cycle. Null when absent.
    [[nodiscard]] const DiscoveredServer* find(const ServiceFullname& key) const;

private:
    friend class PeerReconciler;

    Storage servers_;
};

}  // namespace server_browser
