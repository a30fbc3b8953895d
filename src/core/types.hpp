/**
 * @file types.hpp
 * @brief Vocabulary types shared by the discovery core and the transports.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>

namespace server_browser {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

/// Fully-qualified instance name, e.g. "4242._my-app._udp.local.".
using ServiceFullname = std::string;

/// Textual IPv4/IPv6 address as produced by inet_ntop.
using IpAddress = std::string;

/// Ordered so that two address sets compare equal regardless of the order
/// in which a transport reported them.
using AddressSet = std::set<IpAddress>;

using Port = uint16_t;
using SteadyTime = std::chrono::steady_clock::time_point;

/// mDNS local domain suffix appended to hostnames and service types.
inline constexpr std::string_view LOCAL_DOMAIN_SUFFIX = ".local.";

/**
 * @brief Strip a trailing ".local." from a hostname for display.
 *
 * Returns the input unchanged when the suffix is absent.
 */
[[nodiscard]] inline std::string strip_local_suffix(std::string_view hostname) {
    if (hostname.size() >= LOCAL_DOMAIN_SUFFIX.size()
        && hostname.substr(hostname.size() - LOCAL_DOMAIN_SUFFIX.size()) == LOCAL_DOMAIN_SUFFIX) {
        hostname.remove_suffix(LOCAL_DOMAIN_SUFFIX.size());
    }
    return std::string{hostname};
}

}  // namespace server_browser
