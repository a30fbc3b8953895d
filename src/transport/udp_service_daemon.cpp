/**
 * @file udp_service_daemon.cpp
 * @brief UdpServiceDaemon implementation using POSIX UDP multicast sockets.
 *
 * Three threads: the announce thread re-sends every local service each
 * interval, the listen thread decodes incoming announcements, and the
 * eviction thread expires remote services whose TTL ran out.
 */

#include "transport/udp_service_daemon.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace server_browser {

namespace {

constexpr size_t RECV_BUFFER_SIZE = 2048;
constexpr auto EVICTION_PERIOD = std::chrono::milliseconds(250);

Error errno_error(const std::string& what) {
    return Error{what + ": " + std::strerror(errno)};
}

/// Sleep up to @p duration, waking early when a stop is requested.
void sleep_for(std::stop_token& stop, std::chrono::milliseconds duration) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

Result<std::shared_ptr<UdpServiceDaemon>> UdpServiceDaemon::create(UdpDaemonConfig config) {
    if (config.announce_interval_ms == 0) {
        return Error{"udp daemon: announce_interval_ms must be positive"};
    }
    if (config.peer_timeout_ms == 0) {
        return Error{"udp daemon: peer_timeout_ms must be positive"};
    }

    auto daemon = std::make_shared<UdpServiceDaemon>(Passkey{}, std::move(config));
    if (auto opened = daemon->open_sockets(); !opened) {
        return opened.error().context("udp daemon");
    }
    daemon->start_threads();
    return daemon;
}

UdpServiceDaemon::UdpServiceDaemon(Passkey, UdpDaemonConfig config)
    : config_(std::move(config)) {}

UdpServiceDaemon::~UdpServiceDaemon() {
    shutdown();
}

Result<void> UdpServiceDaemon::open_sockets() {
    in_addr group{};
    if (::inet_pton(AF_INET, config_.multicast_group.c_str(), &group) != 1) {
        return Error{"invalid multicast group " + config_.multicast_group};
    }

    send_fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (send_fd_ < 0) return errno_error("socket");

    unsigned char ttl = config_.multicast_ttl;
    unsigned char loop = 1;
    ::setsockopt(send_fd_, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
    ::setsockopt(send_fd_, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop));

    listen_fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK, 0);
    if (listen_fd_ < 0) {
        auto error = errno_error("socket");
        ::close(send_fd_);
        send_fd_ = -1;
        return error;
    }

    int optval = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));
#ifdef SO_REUSEPORT
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEPORT, &optval, sizeof(optval));
#endif

    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_port = htons(config_.port);
    bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);

    ip_mreq membership{};
    membership.imr_multiaddr = group;
    membership.imr_interface.s_addr = htonl(INADDR_ANY);

    Result<void> status = ok();
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
        status = errno_error("bind port " + std::to_string(config_.port));
    } else if (::setsockopt(listen_fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP,
                            &membership, sizeof(membership)) < 0) {
        status = errno_error("join " + config_.multicast_group);
    }

    if (!status) {
        ::close(send_fd_);
        ::close(listen_fd_);
        send_fd_ = listen_fd_ = -1;
        return status;
    }
    return ok();
}

void UdpServiceDaemon::start_threads() {
    {
        std::lock_guard lock(mutex_);
        running_ = true;
    }
    announce_thread_ = std::jthread([this](std::stop_token stop) { announce_loop(stop); });
    listen_thread_ = std::jthread([this](std::stop_token stop) { listen_loop(stop); });
    eviction_thread_ = std::jthread([this](std::stop_token stop) { eviction_loop(stop); });
}

void UdpServiceDaemon::shutdown() {
    std::vector<ServiceDescriptor> goodbyes;
    {
        std::lock_guard lock(mutex_);
        if (!running_) return;
        running_ = false;
        for (auto& [fullname, service] : local_services_) {
            goodbyes.push_back(service);
        }
        local_services_.clear();
    }

    // Peers evict us on TTL expiry if a goodbye is lost.
    for (const auto& service : goodbyes) {
        if (auto sent = send_record(AnnounceRecord{AnnounceKind::Goodbye, 0, service}); !sent) {
            std::lock_guard lock(mutex_);
            notify_monitors_locked(DaemonError{sent.error().message});
        }
    }

    for (auto* thread : {&announce_thread_, &listen_thread_, &eviction_thread_}) {
        if (thread->joinable()) {
            thread->request_stop();
            thread->join();
        }
    }

    {
        std::lock_guard send_lock(send_mutex_);
        if (send_fd_ >= 0) { ::close(send_fd_); send_fd_ = -1; }
    }
    if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }

    std::lock_guard lock(mutex_);
    for (auto& browser : browsers_) {
        if (auto queue = browser.queue.lock()) queue->close();
    }
    for (auto& weak : monitors_) {
        if (auto queue = weak.lock()) queue->close();
    }
    browsers_.clear();
    monitors_.clear();
    remote_services_.clear();
}

// ─────────────────────────────────────────────
// IServiceDaemon
// ─────────────────────────────────────────────

Result<ServiceFullname> UdpServiceDaemon::register_service(const ServiceDescriptor& service) {
    auto fullname = service.fullname();
    {
        std::lock_guard lock(mutex_);
        if (!running_) return Error{"daemon is shut down"};
        if (!local_services_.try_emplace(fullname, service).second) {
            return Error{"service " + fullname + " is already registered"};
        }
    }

    if (auto sent = send_record(AnnounceRecord{AnnounceKind::Announce, config_.peer_timeout_ms, service});
        !sent) {
        std::lock_guard lock(mutex_);
        local_services_.erase(fullname);
        return sent.error();
    }

    std::lock_guard lock(mutex_);
    notify_monitors_locked(Announce{fullname, config_.multicast_group});
    return fullname;
}

Result<void> UdpServiceDaemon::unregister_service(const ServiceFullname& fullname) {
    ServiceDescriptor service;
    {
        std::lock_guard lock(mutex_);
        if (!running_) return Error{"daemon is shut down"};
        auto it = local_services_.find(fullname);
        if (it == local_services_.end()) {
            return Error{"service " + fullname + " is not registered"};
        }
        service = std::move(it->second);
        local_services_.erase(it);
    }
    return send_record(AnnounceRecord{AnnounceKind::Goodbye, 0, service});
}

Result<ServiceEventStream> UdpServiceDaemon::browse(const std::string& service_type) {
    auto queue = std::make_shared<EventQueue<ServiceEvent>>();
    queue->push(SearchStarted{service_type});

    std::lock_guard lock(mutex_);
    if (!running_) return Error{"daemon is shut down"};
    for (const auto& [fullname, remote] : remote_services_) {
        if (remote.service.service_type != service_type) continue;
        queue->push(ServiceFound{service_type, fullname});
        queue->push(ServiceResolved{remote.service});
    }
    browsers_.push_back(Browser{service_type, queue});
    return queue;
}

Result<DaemonEventStream> UdpServiceDaemon::monitor() {
    auto queue = std::make_shared<EventQueue<DaemonEvent>>();

    std::lock_guard lock(mutex_);
    if (!running_) return Error{"daemon is shut down"};
    monitors_.push_back(queue);
    return queue;
}

size_t UdpServiceDaemon::known_service_count() const {
    std::lock_guard lock(mutex_);
    return remote_services_.size();
}

// ─────────────────────────────────────────────
// Wire
// ─────────────────────────────────────────────

Result<void> UdpServiceDaemon::send_record(const AnnounceRecord& record) {
    auto encoded = AnnounceCodec::encode(record);
    if (!encoded) return encoded.error();

    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(config_.port);
    ::inet_pton(AF_INET, config_.multicast_group.c_str(), &dest.sin_addr);

    std::lock_guard send_lock(send_mutex_);
    if (send_fd_ < 0) return Error{"daemon is shut down"};
    auto sent = ::sendto(send_fd_, encoded->data(), encoded->size(), 0,
                         reinterpret_cast<const sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) return errno_error("sendto " + config_.multicast_group);
    return ok();
}

void UdpServiceDaemon::handle_record(AnnounceRecord record, const IpAddress& sender) {
    auto fullname = record.service.fullname();
    const auto& service_type = record.service.service_type;

    std::lock_guard lock(mutex_);
    if (!running_) return;

    if (record.kind == AnnounceKind::Goodbye) {
        if (remote_services_.erase(fullname) > 0) {
            deliver_locked(service_type, ServiceRemoved{service_type, fullname});
        }
        return;
    }

    auto ttl = std::chrono::milliseconds(record.ttl_ms > 0 ? record.ttl_ms : config_.peer_timeout_ms);
    auto expires_at = std::chrono::steady_clock::now() + ttl;

    auto it = remote_services_.find(fullname);
    if (it == remote_services_.end()) {
        record.service.addresses = {sender};
        it = remote_services_.emplace(fullname, RemoteService{record.service, expires_at}).first;
        deliver_locked(service_type, ServiceFound{service_type, fullname});
    } else {
        record.service.addresses = it->second.service.addresses;
        record.service.addresses.insert(sender);
        it->second = RemoteService{record.service, expires_at};
    }
    deliver_locked(service_type, ServiceResolved{it->second.service});
}

void UdpServiceDaemon::deliver_locked(const std::string& service_type, const ServiceEvent& event) {
    std::erase_if(browsers_, [&](const Browser& browser) {
        auto queue = browser.queue.lock();
        if (!queue || queue->is_closed()) return true;
        if (browser.service_type == service_type) queue->push(event);
        return false;
    });
}

void UdpServiceDaemon::notify_monitors_locked(const DaemonEvent& event) {
    std::erase_if(monitors_, [&](const std::weak_ptr<EventQueue<DaemonEvent>>& weak) {
        auto queue = weak.lock();
        if (!queue || queue->is_closed()) return true;
        queue->push(event);
        return false;
    });
}

// ─────────────────────────────────────────────
// Announce Thread
// ─────────────────────────────────────────────

void UdpServiceDaemon::announce_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        sleep_for(stop, std::chrono::milliseconds(config_.announce_interval_ms));
        if (stop.stop_requested()) break;

        std::vector<ServiceDescriptor> services;
        {
            std::lock_guard lock(mutex_);
            for (const auto& [fullname, service] : local_services_) {
                services.push_back(service);
            }
        }

        for (const auto& service : services) {
            auto sent = send_record(AnnounceRecord{AnnounceKind::Announce, config_.peer_timeout_ms, service});
            if (!sent) {
                std::lock_guard lock(mutex_);
                notify_monitors_locked(DaemonError{sent.error().message});
            } else {
                std::lock_guard lock(mutex_);
                notify_monitors_locked(Announce{service.fullname(), config_.multicast_group});
            }
        }
    }
}

// ─────────────────────────────────────────────
// Listen Thread
// ─────────────────────────────────────────────

void UdpServiceDaemon::listen_loop(std::stop_token stop) {
    uint8_t buffer[RECV_BUFFER_SIZE];

    while (!stop.stop_requested()) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, 100);  // 100ms timeout
        if (ready <= 0) continue;

        sockaddr_in sender_addr{};
        socklen_t addr_len = sizeof(sender_addr);
        auto bytes_read = ::recvfrom(listen_fd_, buffer, sizeof(buffer), 0,
                                     reinterpret_cast<sockaddr*>(&sender_addr), &addr_len);
        if (bytes_read <= 0) continue;

        // Anything else on the group (other protocols, other versions) is dropped.
        auto record = AnnounceCodec::decode(buffer, static_cast<size_t>(bytes_read));
        if (!record) continue;

        char ip_buf[INET_ADDRSTRLEN];
        ::inet_ntop(AF_INET, &sender_addr.sin_addr, ip_buf, sizeof(ip_buf));

        handle_record(std::move(*record), IpAddress{ip_buf});
    }
}

// ─────────────────────────────────────────────
// Eviction Thread
// ─────────────────────────────────────────────

void UdpServiceDaemon::eviction_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            auto now = std::chrono::steady_clock::now();
            std::lock_guard lock(mutex_);
            for (auto it = remote_services_.begin(); it != remote_services_.end(); ) {
                if (it->second.expires_at <= now) {
                    auto service_type = it->second.service.service_type;
                    auto fullname = it->first;
                    it = remote_services_.erase(it);
                    deliver_locked(service_type, ServiceRemoved{service_type, fullname});
                } else {
                    ++it;
                }
            }
        }
        sleep_for(stop, EVICTION_PERIOD);
    }
}

}  // namespace server_browser
