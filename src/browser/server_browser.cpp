/**
 * @file server_browser.cpp
 * @brief ServerBrowser implementation.
 */

#include "browser/server_browser.hpp"

namespace server_browser {

namespace {

constexpr std::string_view COMPONENT = "browser";

MetadataExtractor make_extractor(const BrowserOptions& options) {
    switch (options.metadata) {
        case MetadataShape::NameOnly:
            return name_only(options.name_key, options.fallback_name);
        case MetadataShape::Full:
            break;
    }
    return full_metadata();
}

}  // anonymous namespace

BrowserOptions options_from_config(const BrowserConfig& config) {
    BrowserOptions options;
    options.namespace_id = config.service_namespace;
    options.metadata = config.metadata;
    options.name_key = config.name_key;
    options.fallback_name = config.fallback_name;
    options.merge_policy = config.merge_policy;
    return options;
}

Result<std::unique_ptr<ServerBrowser>> ServerBrowser::create(
    BrowserOptions options,
    std::shared_ptr<IServiceDaemon> daemon,
    Logger* logger) {
    if (!daemon) {
        return Error{"no service daemon"};
    }

    auto parsed = ServiceNamespace::parse(options.namespace_id);
    if (!parsed) {
        return parsed.error().context("namespace '" + options.namespace_id + "'");
    }

    auto browser = std::make_unique<ServerBrowser>(Passkey{}, std::move(*parsed), options,
                                                   std::move(daemon), logger);

    if (logger) {
        logger->info(COMPONENT, "Service type " + browser->namespace_.service_type()
                                + ", merge policy " + std::string{to_string(options.merge_policy)});
    }
    return browser;
}

ServerBrowser::ServerBrowser(Passkey,
                             ServiceNamespace service_namespace,
                             const BrowserOptions& options,
                             std::shared_ptr<IServiceDaemon> daemon,
                             Logger* logger)
    : namespace_(std::move(service_namespace))
    , logger_(logger)
    , registration_(namespace_, daemon, logger,
                    options.identity ? *options.identity : HostIdentity::local())
    , session_(namespace_, daemon, logger)
    , reconciler_(make_extractor(options), options.merge_policy, logger)
    , tap_(logger) {}

void ServerBrowser::advertise(DiscoverableServer server) {
    registration_pending_ = true;
    desired_ = std::move(server);
}

void ServerBrowser::withdraw() {
    registration_pending_ = true;
    desired_.reset();
}

Result<void> ServerBrowser::apply_registration() {
    if (!registration_pending_) return ok();
    registration_pending_ = false;

    if (desired_) return registration_.advertise(*desired_);
    return registration_.withdraw();
}

Result<bool> ServerBrowser::update() {
    changed_ = false;

    if (auto applied = apply_registration(); !applied) {
        if (logger_) logger_->error(COMPONENT, applied.error().message);
        return applied.error();
    }

    auto started = session_.start_pending(reconciler_);
    if (!started) {
        if (logger_) logger_->error(COMPONENT, started.error().message);
        return started.error();
    }
    changed_ = *started;

    tap_.drain(registration_.monitor_stream());

    if (session_.poll(reconciler_)) changed_ = true;

    if (changed_ && on_changed_) on_changed_(reconciler_.servers());
    return changed_;
}

}  // namespace server_browser
