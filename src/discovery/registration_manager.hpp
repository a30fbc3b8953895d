/**
 * @file registration_manager.hpp
 * @brief Lifecycle of the service record this process advertises.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "discovery/server_metadata.hpp"
#include "discovery/service_namespace.hpp"
#include "transport/service_daemon.hpp"

#include <memory>
#include <optional>
#include <string>

namespace server_browser {

/**
 * @brief What the host wants to advertise.
 *
 * The port is informational: clients read it from the discovered record,
 * nothing binds to it here.
 */
struct DiscoverableServer {
    Port port{0};
    ServerMetadata metadata;

    bool operator==(const DiscoverableServer&) const = default;
};

/**
 * @brief Instance name and hostname placed in the advertised record.
 */
struct HostIdentity {
    std::string instance_name;   ///< Unique per process on this host
    std::string hostname;        ///< Without domain, e.g. "desktop"

    /// Process id and gethostname().
    [[nodiscard]] static HostIdentity local();
};

/**
 * @brief Registered/Unregistered state machine around one service record.
 *
 *   Unregistered --advertise--> Registered
 *   Registered   --advertise(different)--> unregister old, register new
 *   Registered   --withdraw--> Unregistered
 *
 * A daemon monitor stream is open exactly while Registered. Every daemon
 * failure is returned to the caller, which treats it as fatal.
 */
class RegistrationManager {
public:
    RegistrationManager(ServiceNamespace service_namespace,
                        std::shared_ptr<IServiceDaemon> daemon,
                        Logger* logger = nullptr,
                        HostIdentity identity = HostIdentity::local());

    /**
     * @brief Register @p server, replacing any current registration.
     *
     * Re-advertising the record that is already registered does nothing.
     */
    Result<void> advertise(const DiscoverableServer& server);

    /// Unregister. Does nothing when Unregistered.
    Result<void> withdraw();

    /// The descriptor that advertise() would hand to the daemon.
    [[nodiscard]] ServiceDescriptor describe(const DiscoverableServer& server) const;

    [[nodiscard]] bool is_registered() const noexcept { return fullname_.has_value(); }
    [[nodiscard]] const std::optional<ServiceFullname>& fullname() const noexcept { return fullname_; }
    [[nodiscard]] const std::optional<DiscoverableServer>& advertised() const noexcept { return advertised_; }

    /// Monitor stream for the EventLogTap; null while Unregistered.
    [[nodiscard]] const DaemonEventStream& monitor_stream() const noexcept { return monitor_; }

private:
    ServiceNamespace namespace_;
    std::shared_ptr<IServiceDaemon> daemon_;
    Logger* logger_;
    HostIdentity identity_;

    std::optional<ServiceFullname> fullname_;
    std::optional<DiscoverableServer> advertised_;
    DaemonEventStream monitor_;
};

}  // namespace server_browser
