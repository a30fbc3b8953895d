/**
 * @file loopback_daemon.cpp
 * @brief LoopbackNetwork and LoopbackDaemon implementations.
 */

#include "transport/loopback_daemon.hpp"

#include <algorithm>

namespace server_browser {

// ─────────────────────────────────────────────
// LoopbackNetwork
// ─────────────────────────────────────────────

bool LoopbackNetwork::publish(const ServiceDescriptor& service) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = published_.try_emplace(service.fullname(), service);
    if (!inserted) return false;

    deliver_locked(service.service_type, ServiceFound{service.service_type, service.fullname()});
    deliver_locked(service.service_type, ServiceResolved{service});
    return true;
}

bool LoopbackNetwork::withdraw(const ServiceFullname& fullname) {
    std::lock_guard lock(mutex_);
    auto it = published_.find(fullname);
    if (it == published_.end()) return false;

    auto service_type = it->second.service_type;
    published_.erase(it);
    deliver_locked(service_type, ServiceRemoved{service_type, fullname});
    return true;
}

void LoopbackNetwork::resolve_again(const ServiceDescriptor& service) {
    std::lock_guard lock(mutex_);
    deliver_locked(service.service_type, ServiceResolved{service});
}

void LoopbackNetwork::broadcast(const std::string& service_type, const ServiceEvent& event) {
    std::lock_guard lock(mutex_);
    deliver_locked(service_type, event);
}

ServiceEventStream LoopbackNetwork::open_browser(const std::string& service_type) {
    auto queue = std::make_shared<EventQueue<ServiceEvent>>();
    queue->push(SearchStarted{service_type});

    std::lock_guard lock(mutex_);
    for (const auto& [fullname, service] : published_) {
        if (service.service_type != service_type) continue;
        queue->push(ServiceFound{service_type, fullname});
        queue->push(ServiceResolved{service});
    }
    browsers_.push_back(Browser{service_type, queue});
    return queue;
}

size_t LoopbackNetwork::published_count() const {
    std::lock_guard lock(mutex_);
    return published_.size();
}

size_t LoopbackNetwork::live_browser_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(browsers_.begin(), browsers_.end(),
        [](const Browser& b) { return !b.queue.expired(); }));
}

void LoopbackNetwork::deliver_locked(const std::string& service_type, const ServiceEvent& event) {
    // Browsers whose stream was dropped are forgotten here.
    std::erase_if(browsers_, [&](const Browser& browser) {
        auto queue = browser.queue.lock();
        if (!queue || queue->is_closed()) return true;
        if (browser.service_type == service_type) queue->push(event);
        return false;
    });
}

// ─────────────────────────────────────────────
// LoopbackDaemon
// ─────────────────────────────────────────────

LoopbackDaemon::LoopbackDaemon(std::shared_ptr<LoopbackNetwork> network, AddressSet addresses)
    : network_(std::move(network)), addresses_(std::move(addresses)) {}

LoopbackDaemon::~LoopbackDaemon() {
    shutdown();
}

Result<ServiceFullname> LoopbackDaemon::register_service(const ServiceDescriptor& service) {
    std::lock_guard lock(mutex_);
    register_calls_.push_back(service);
    if (shut_down_) return Error{"daemon is shut down"};
    if (auto failure = take_failure(Operation::Register)) return *failure;

    ServiceDescriptor published = service;
    if (published.addresses.empty()) published.addresses = addresses_;

    auto fullname = published.fullname();
    if (!network_->publish(published)) {
        return Error{"service " + fullname + " is already registered"};
    }
    registered_.emplace(fullname, published);
    notify_monitors(Announce{fullname, "loopback"});
    return fullname;
}

Result<void> LoopbackDaemon::unregister_service(const ServiceFullname& fullname) {
    std::lock_guard lock(mutex_);
    unregister_calls_.push_back(fullname);
    if (shut_down_) return Error{"daemon is shut down"};
    if (auto failure = take_failure(Operation::Unregister)) return *failure;

    if (registered_.erase(fullname) == 0) {
        return Error{"service " + fullname + " is not registered by this daemon"};
    }
    network_->withdraw(fullname);
    return ok();
}

Result<ServiceEventStream> LoopbackDaemon::browse(const std::string& service_type) {
    std::lock_guard lock(mutex_);
    ++browse_calls_;
    if (shut_down_) return Error{"daemon is shut down"};
    if (auto failure = take_failure(Operation::Browse)) return *failure;
    return network_->open_browser(service_type);
}

Result<DaemonEventStream> LoopbackDaemon::monitor() {
    std::lock_guard lock(mutex_);
    if (shut_down_) return Error{"daemon is shut down"};
    if (auto failure = take_failure(Operation::Monitor)) return *failure;

    auto queue = std::make_shared<EventQueue<DaemonEvent>>();
    for (const auto& address : addresses_) {
        queue->push(IpAdded{address});
    }
    monitors_.push_back(queue);
    return queue;
}

void LoopbackDaemon::shutdown() {
    std::lock_guard lock(mutex_);
    if (shut_down_) return;
    shut_down_ = true;

    for (const auto& [fullname, service] : registered_) {
        network_->withdraw(fullname);
    }
    registered_.clear();

    for (auto& weak : monitors_) {
        if (auto queue = weak.lock()) queue->close();
    }
    monitors_.clear();
}

void LoopbackDaemon::fail_next(Operation op, std::string message) {
    std::lock_guard lock(mutex_);
    pending_failures_[op] = std::move(message);
}

void LoopbackDaemon::announce_again() {
    std::lock_guard lock(mutex_);
    for (const auto& [fullname, service] : registered_) {
        network_->resolve_again(service);
    }
}

std::vector<ServiceDescriptor> LoopbackDaemon::register_calls() const {
    std::lock_guard lock(mutex_);
    return register_calls_;
}

std::vector<ServiceFullname> LoopbackDaemon::unregister_calls() const {
    std::lock_guard lock(mutex_);
    return unregister_calls_;
}

size_t LoopbackDaemon::browse_calls() const {
    std::lock_guard lock(mutex_);
    return browse_calls_;
}

std::optional<Error> LoopbackDaemon::take_failure(Operation op) {
    auto it = pending_failures_.find(op);
    if (it == pending_failures_.end()) return std::nullopt;
    Error error{std::move(it->second)};
    pending_failures_.erase(it);
    return error;
}

void LoopbackDaemon::notify_monitors(const DaemonEvent& event) {
    std::erase_if(monitors_, [&](const std::weak_ptr<EventQueue<DaemonEvent>>& weak) {
        auto queue = weak.lock();
        if (!queue || queue->is_closed()) return true;
        queue->push(event);
        return false;
    });
}

}  // namespace server_browser
