/**
 * @file loopback_daemon.hpp
 * @brief In-process IServiceDaemon for tests and single-process demos.
 *
 * Several LoopbackDaemon instances attached to one LoopbackNetwork behave
 * like processes on one LAN: a registration on any of them resolves in every
 * matching browse, an unregistration removes it. Events are delivered
 * synchronously into the browse queues; consumers see them on their next
 * drain.
 */

#pragma once

#include "transport/service_daemon.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace server_browser {

/**
 * @brief The shared medium. Thread-safe.
 */
class LoopbackNetwork {
public:
    /// Returns false when @p service's fullname is already published.
    bool publish(const ServiceDescriptor& service);
    bool withdraw(const ServiceFullname& fullname);

    /// Deliver @p service as resolved to every live browser of its type.
    void resolve_again(const ServiceDescriptor& service);

    /// Deliver an arbitrary event to every live browser of @p service_type.
    void broadcast(const std::string& service_type, const ServiceEvent& event);

    /// New browse stream, pre-filled with every published match.
    ServiceEventStream open_browser(const std::string& service_type);

    [[nodiscard]] size_t published_count() const;
    [[nodiscard]] size_t live_browser_count() const;

private:
    struct Browser {
        std::string service_type;
        std::weak_ptr<EventQueue<ServiceEvent>> queue;
    };

    void deliver_locked(const std::string& service_type, const ServiceEvent& event);

    mutable std::mutex mutex_;
    std::map<ServiceFullname, ServiceDescriptor> published_;
    std::vector<Browser> browsers_;
};

class LoopbackDaemon : public IServiceDaemon {
public:
    enum class Operation : uint8_t { Register, Unregister, Browse, Monitor };

    explicit LoopbackDaemon(std::shared_ptr<LoopbackNetwork> network = std::make_shared<LoopbackNetwork>(),
                            AddressSet addresses = {"127.0.0.1"});
    ~LoopbackDaemon() override;

    Result<ServiceFullname> register_service(const ServiceDescriptor& service) override;
    Result<void> unregister_service(const ServiceFullname& fullname) override;
    Result<ServiceEventStream> browse(const std::string& service_type) override;
    Result<DaemonEventStream> monitor() override;
    void shutdown() override;

    /// Make the next call of @p op fail with @p message.
    void fail_next(Operation op, std::string message);

    /// Re-resolve every service registered through this daemon, as a real
    /// daemon does periodically with unchanged data.
    void announce_again();

    /// Every descriptor passed to register_service, in call order.
    [[nodiscard]] std::vector<ServiceDescriptor> register_calls() const;
    [[nodiscard]] std::vector<ServiceFullname> unregister_calls() const;
    [[nodiscard]] size_t browse_calls() const;

    [[nodiscard]] const std::shared_ptr<LoopbackNetwork>& network() const noexcept { return network_; }

private:
    std::optional<Error> take_failure(Operation op);
    void notify_monitors(const DaemonEvent& event);

    std::shared_ptr<LoopbackNetwork> network_;
    AddressSet addresses_;

    mutable std::mutex mutex_;
    bool shut_down_ = false;
    std::map<ServiceFullname, ServiceDescriptor> registered_;
    std::vector<std::weak_ptr<EventQueue<DaemonEvent>>> monitors_;
    std::map<Operation, std::string> pending_failures_;

    std::vector<ServiceDescriptor> register_calls_;
    std::vector<ServiceFullname> unregister_calls_;
    size_t browse_calls_ = 0;
};

}  // namespace server_browser
