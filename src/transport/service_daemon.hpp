/**
 * @file service_daemon.hpp
 * @brief Boundary between the discovery core and a service-discovery daemon.
 *
 * The daemon is process-wide: the host creates one and hands the same
 * shared_ptr to the registration side and the browse side. Register and
 * unregister are synchronous; browse and monitor return an event stream at
 * once and fill it from the daemon's own threads.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "discovery/server_metadata.hpp"
#include "transport/event_queue.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace server_browser {

// ─────────────────────────────────────────────
// Service Descriptor
// ─────────────────────────────────────────────

/**
 * @brief One DNS-SD service instance, either advertised or resolved.
 */
struct ServiceDescriptor {
    std::string service_type;       ///< "_my-app._udp.local."
    std::string instance_name;      ///< "4242"
    std::string hostname;           ///< "desktop.local."
    Port port{0};
    ServerMetadata properties;      ///< TXT key/value pairs
    AddressSet addresses;           ///< Empty when advertising: daemon fills them in

    /// "{instance_name}.{service_type}"
    [[nodiscard]] ServiceFullname fullname() const {
        return instance_name + "." + service_type;
    }

    bool operator==(const ServiceDescriptor&) const = default;
};

// ─────────────────────────────────────────────
// Browse Events
// ─────────────────────────────────────────────

struct SearchStarted {
    std::string service_type;
};

/// Instance name seen, not yet resolved to host/port/addresses.
struct ServiceFound {
    std::string service_type;
    ServiceFullname fullname;
};

struct ServiceResolved {
    ServiceDescriptor info;
};

struct ServiceRemoved {
    std::string service_type;
    ServiceFullname fullname;
};

struct SearchStopped {
    std::string service_type;
};

using ServiceEvent = std::variant<SearchStarted, ServiceFound, ServiceResolved,
                                  ServiceRemoved, SearchStopped>;

// ─────────────────────────────────────────────
// Daemon (monitor) Events
// ─────────────────────────────────────────────

/// A registered service was announced on an interface.
struct Announce {
    ServiceFullname fullname;
    std::string interface;
};

struct DaemonError {
    std::string message;
};

struct IpAdded {
    IpAddress address;
};

struct IpRemoved {
    IpAddress address;
};

using DaemonEvent = std::variant<Announce, DaemonError, IpAdded, IpRemoved>;

using ServiceEventStream = std::shared_ptr<EventQueue<ServiceEvent>>;
using DaemonEventStream = std::shared_ptr<EventQueue<DaemonEvent>>;

[[nodiscard]] std::string describe(const ServiceEvent& event);
[[nodiscard]] std::string describe(const DaemonEvent& event);

// ─────────────────────────────────────────────
// IServiceDaemon
// ─────────────────────────────────────────────

/**
 * @brief Abstract service-discovery daemon.
 *
 * Every call either succeeds completely or returns an error; the discovery
 * core treats any error as fatal and does not retry.
 */
class IServiceDaemon {
public:
    virtual ~IServiceDaemon() = default;

    /// Publish @p service. Returns the fully-qualified name to unregister with.
    virtual Result<ServiceFullname> register_service(const ServiceDescriptor& service) = 0;

    virtual Result<void> unregister_service(const ServiceFullname& fullname) = 0;

    /// Start browsing @p service_type. Dropping the stream ends the browse.
    virtual Result<ServiceEventStream> browse(const std::string& service_type) = 0;

    /// Stream of daemon-level diagnostic events. May be called repeatedly.
    virtual Result<DaemonEventStream> monitor() = 0;

    virtual void shutdown() = 0;
};

}  // namespace server_browser
