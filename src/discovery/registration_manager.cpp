/**
 * @file registration_manager.cpp
 * @brief RegistrationManager implementation.
 */

#include "discovery/registration_manager.hpp"

#include "platform/host_info.hpp"

namespace server_browser {

namespace {

constexpr std::string_view COMPONENT = "registry";

}  // anonymous namespace

HostIdentity HostIdentity::local() {
    return HostIdentity{std::to_string(process_id()), local_hostname()};
}

RegistrationManager::RegistrationManager(ServiceNamespace service_namespace,
                                         std::shared_ptr<IServiceDaemon> daemon,
                                         Logger* logger,
                                         HostIdentity identity)
    : namespace_(std::move(service_namespace))
    , daemon_(std::move(daemon))
    , logger_(logger)
    , identity_(std::move(identity)) {}

ServiceDescriptor RegistrationManager::describe(const DiscoverableServer& server) const {
    ServiceDescriptor service;
    service.service_type = namespace_.service_type();
    service.instance_name = identity_.instance_name;
    service.hostname = identity_.hostname + std::string{LOCAL_DOMAIN_SUFFIX};
    service.port = server.port;
    service.properties = server.metadata;
    return service;
}

Result<void> RegistrationManager::advertise(const DiscoverableServer& server) {
    if (is_registered() && advertised_ == server) return ok();

    if (is_registered()) {
        if (auto withdrawn = withdraw(); !withdrawn) {
            return withdrawn.error();
        }
    }

    // Opened first so a monitor failure leaves nothing registered.
    auto monitor = daemon_->monitor();
    if (!monitor) {
        return monitor.error().context("monitor");
    }

    auto service = describe(server);
    auto registered = daemon_->register_service(service);
    if (!registered) {
        return registered.error().context("register " + service.fullname());
    }

    fullname_ = std::move(*registered);
    advertised_ = server;
    monitor_ = std::move(*monitor);

    if (logger_) {
        logger_->info(COMPONENT, "Registered " + *fullname_ + " on port "
                                 + std::to_string(server.port) + " with metadata "
                                 + server.metadata.to_string());
    }
    return ok();
}

Result<void> RegistrationManager::withdraw() {
    if (!is_registered()) return ok();

    auto unregistered = daemon_->unregister_service(*fullname_);
    if (!unregistered) {
        return unregistered.error().context("unregister " + *fullname_);
    }

    if (logger_) logger_->info(COMPONENT, "Unregistered " + *fullname_);

    fullname_.reset();
    advertised_.reset();
    if (monitor_) monitor_->close();
    monitor_.reset();
    return ok();
}

}  // namespace server_browser
