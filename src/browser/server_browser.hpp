/**
 * @file server_browser.hpp
 * @brief Host-facing facade: advertise a server, browse for peers, poll once per frame.
 *
 * The host calls update() once per cycle (for example once per game frame).
 * Triggers raised between two cycles are applied at the start of the next
 * one, in this order:
 *
 *   1. registration transition (advertise / withdraw, last trigger wins)
 *   2. search restart (any number of search() calls start one browse)
 *   3. daemon monitor events are drained to the log
 *   4. browse events are reconciled into servers()
 *
 * Every transport failure is returned from update() and is fatal for the host.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "discovery/discovery_session.hpp"
#include "discovery/event_log_tap.hpp"
#include "discovery/peer_reconciler.hpp"
#include "discovery/registration_manager.hpp"
#include "discovery/server_list.hpp"
#include "discovery/service_namespace.hpp"
#include "transport/service_daemon.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace server_browser {

struct BrowserOptions {
    std::string namespace_id = "test-id";
    MetadataShape metadata = MetadataShape::Full;
    std::string name_key = "name";
    std::string fallback_name = "Unknown Server";
    MergePolicy merge_policy = MergePolicy::Overwrite;

    /// Overrides the pid/hostname identity of the advertised record.
    std::optional<HostIdentity> identity;
};

[[nodiscard]] BrowserOptions options_from_config(const BrowserConfig& config);

class ServerBrowser {
    /// Only create() can construct one.
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    using ChangedCallback = std::function<void(const ServerList&)>;

    /**
     * @brief Validate the namespace and wire the components around @p daemon.
     *
     * An invalid namespace is returned as an error; nothing is registered
     * or browsed in that case.
     */
    [[nodiscard]] static Result<std::unique_ptr<ServerBrowser>> create(
        BrowserOptions options,
        std::shared_ptr<IServiceDaemon> daemon,
        Logger* logger = nullptr);

    ServerBrowser(Passkey,
                  ServiceNamespace service_namespace,
                  const BrowserOptions& options,
                  std::shared_ptr<IServiceDaemon> daemon,
                  Logger* logger);

    ServerBrowser(const ServerBrowser&) = delete;
    ServerBrowser& operator=(const ServerBrowser&) = delete;

    // ── Triggers (applied on the next update) ──

    void advertise(DiscoverableServer server);
    void withdraw();
    void search() noexcept { session_.request_search(); }

    /**
     * @brief Run one cycle.
     * @return whether servers() changed during this cycle.
     */
    Result<bool> update();

    // ── Observation ──

    [[nodiscard]] const ServerList& servers() const noexcept { return reconciler_.servers(); }
    [[nodiscard]] bool changed() const noexcept { return changed_; }
    [[nodiscard]] bool is_registered() const noexcept { return registration_.is_registered(); }
    [[nodiscard]] bool is_searching() const noexcept { return session_.is_active(); }

    [[nodiscard]] const ServiceNamespace& service_namespace() const noexcept { return namespace_; }
    [[nodiscard]] const RegistrationManager& registration() const noexcept { return registration_; }
    [[nodiscard]] const EventLogTap& event_log() const noexcept { return tap_; }

    /// Called at most once per update(), after reconciliation, when changed().
    void on_servers_changed(ChangedCallback callback) { on_changed_ = std::move(callback); }

private:
    Result<void> apply_registration();

    ServiceNamespace namespace_;
    Logger* logger_;

    RegistrationManager registration_;
    DiscoverySession session_;
    PeerReconciler reconciler_;
    EventLogTap tap_;

    bool registration_pending_ = false;
    std::optional<DiscoverableServer> desired_;

    bool changed_ = false;
    ChangedCallback on_changed_;
};

}  // namespace server_browser
