/**
 * @file discovery_session.cpp
 * @brief DiscoverySession implementation.
 */

#include "discovery/discovery_session.hpp"

namespace server_browser {

namespace {

constexpr std::string_view COMPONENT = "discovery";

}  // anonymous namespace

DiscoverySession::DiscoverySession(ServiceNamespace service_namespace,
                                   std::shared_ptr<IServiceDaemon> daemon,
                                   Logger* logger)
    : namespace_(std::move(service_namespace))
    , daemon_(std::move(daemon))
    , logger_(logger) {}

Result<bool> DiscoverySession::start_pending(PeerReconciler& reconciler) {
    if (!search_requested_) return false;
    search_requested_ = false;

    stream_.reset();
    bool cleared = reconciler.clear();

    auto service_type = namespace_.service_type();
    auto browse = daemon_->browse(service_type);
    if (!browse) {
        return browse.error().context("browse " + service_type);
    }
    stream_ = std::move(*browse);

    if (logger_) logger_->info(COMPONENT, "Searching for servers of type " + service_type);
    return cleared;
}

bool DiscoverySession::poll(PeerReconciler& reconciler) {
    if (!stream_) return false;
    return reconciler.reconcile(*stream_);
}

}  // namespace server_browser
