/**
 * @file discovery_session.hpp
 * @brief Owns the in-flight browse for the application's service type.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "discovery/peer_reconciler.hpp"
#include "discovery/service_namespace.hpp"
#include "transport/service_daemon.hpp"

#include <memory>

namespace server_browser {

/**
 * @brief Search lifecycle: request → (next cycle) clear + browse → drain.
 *
 * At most one browse stream is held. Starting a new search drops the old
 * stream (the daemon stops feeding a stream nobody owns) and clears the
 * discovered servers before any event from the new browse is applied.
 * Any number of requests between two cycles start exactly one search.
 */
class DiscoverySession {
public:
    DiscoverySession(ServiceNamespace service_namespace,
                     std::shared_ptr<IServiceDaemon> daemon,
                     Logger* logger = nullptr);

    /// Queue a search for the next cycle. Safe to call repeatedly.
    void request_search() noexcept { search_requested_ = true; }

    [[nodiscard]] bool search_pending() const noexcept { return search_requested_; }

    /**
     * @brief Start the queued search, if any.
     *
     * Clears @p reconciler and replaces the browse stream. A browse failure
     * is returned as-is; the previous stream is already gone at that point.
     *
     * @return true if a search was started and the servers list was cleared
     *         from a non-empty state.
     */
    Result<bool> start_pending(PeerReconciler& reconciler);

    /**
     * @brief Drain the active browse into @p reconciler.
     * @return true if the servers list changed. False when not searching.
     */
    bool poll(PeerReconciler& reconciler);

    [[nodiscard]] bool is_active() const noexcept { return stream_ != nullptr; }
    [[nodiscard]] const ServiceEventStream& stream() const noexcept { return stream_; }

private:
    ServiceNamespace namespace_;
    std::shared_ptr<IServiceDaemon> daemon_;
    Logger* logger_;

    ServiceEventStream stream_;
    bool search_requested_ = false;
};

}  // namespace server_browser
