/**
 * @file udp_service_daemon.hpp
 * @brief IServiceDaemon over IPv4 UDP multicast.
 *
 * Each registered service is announced on a multicast group at a fixed
 * interval. Every received announcement is reported to matching browsers as
 * ServiceResolved, unchanged or not, the same way an mDNS daemon keeps
 * re-resolving; the reconciler filters out the repeats. A goodbye packet,
 * or silence longer than the record's TTL, yields ServiceRemoved.
 *
 * The packet format is AnnounceCodec's, not RFC 6762 DNS.
 */

#pragma once

#include "transport/announce_codec.hpp"
#include "transport/service_daemon.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace server_browser {

struct UdpDaemonConfig {
    std::string multicast_group = "239.255.42.99";
    uint16_t port = 5354;
    uint32_t announce_interval_ms = 1000;
    uint32_t peer_timeout_ms = 3500;      ///< TTL advertised in our announcements
    uint8_t multicast_ttl = 1;            ///< Link-local: never routed
};

class UdpServiceDaemon : public IServiceDaemon {
    /// Only create() can construct one.
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    /**
     * @brief Open the sockets, join the group and start the worker threads.
     *
     * Fails when an interval is zero or the sockets cannot be created or
     * bound; the host treats that as fatal at startup.
     */
    static Result<std::shared_ptr<UdpServiceDaemon>> create(UdpDaemonConfig config);

    UdpServiceDaemon(Passkey, UdpDaemonConfig config);

    ~UdpServiceDaemon() override;

    UdpServiceDaemon(const UdpServiceDaemon&) = delete;
    UdpServiceDaemon& operator=(const UdpServiceDaemon&) = delete;

    Result<ServiceFullname> register_service(const ServiceDescriptor& service) override;
    Result<void> unregister_service(const ServiceFullname& fullname) override;
    Result<ServiceEventStream> browse(const std::string& service_type) override;
    Result<DaemonEventStream> monitor() override;

    /// Send goodbyes for our services, stop the threads, close every stream.
    void shutdown() override;

    [[nodiscard]] size_t known_service_count() const;

private:
    Result<void> open_sockets();
    void start_threads();

    void announce_loop(std::stop_token stop);
    void listen_loop(std::stop_token stop);
    void eviction_loop(std::stop_token stop);

    Result<void> send_record(const AnnounceRecord& record);
    void handle_record(AnnounceRecord record, const IpAddress& sender);

    void deliver_locked(const std::string& service_type, const ServiceEvent& event);
    void notify_monitors_locked(const DaemonEvent& event);

    UdpDaemonConfig config_;

    std::mutex send_mutex_;    ///< Guards send_fd_ against close during a send
    int send_fd_ = -1;
    int listen_fd_ = -1;

    std::jthread announce_thread_;
    std::jthread listen_thread_;
    std::jthread eviction_thread_;

    struct RemoteService {
        ServiceDescriptor service;
        std::chrono::steady_clock::time_point expires_at;
    };

    struct Browser {
        std::string service_type;
        std::weak_ptr<EventQueue<ServiceEvent>> queue;
    };

    mutable std::mutex mutex_;
    bool running_ = false;
    std::map<ServiceFullname, ServiceDescriptor> local_services_;
    std::map<ServiceFullname, RemoteService> remote_services_;
    std::vector<Browser> browsers_;
    std::vector<std::weak_ptr<EventQueue<DaemonEvent>>> monitors_;
};

}  // namespace server_browser
