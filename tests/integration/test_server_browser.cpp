/**
 * @file test_server_browser.cpp
 * @brief Integration tests driving full ServerBrowser cycles over a shared network.
 */

#include "browser/server_browser.hpp"
#include "core/config.hpp"
#include "telemetry/log_sinks.hpp"
#include "transport/loopback_daemon.hpp"
#include "transport/udp_service_daemon.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>

using namespace server_browser;

namespace {

BrowserOptions options_for(const std::string& instance,
                           MetadataShape shape = MetadataShape::Full) {
    BrowserOptions options;
    options.namespace_id = "test_id";
    options.metadata = shape;
    options.identity = HostIdentity{instance, "host-" + instance};
    return options;
}

DiscoverableServer test_server(Port port = 1234, std::string name = "Test Server") {
    return DiscoverableServer{port, ServerMetadata{}.with("name", name)};
}

}  // namespace

class ServerBrowserIntegration : public ::testing::Test {
protected:
    std::shared_ptr<LoopbackNetwork> network_ = std::make_shared<LoopbackNetwork>();

    std::unique_ptr<ServerBrowser> make_browser(const std::string& instance,
                                                std::shared_ptr<LoopbackDaemon> daemon,
                                                MetadataShape shape = MetadataShape::Full) {
        auto browser = ServerBrowser::create(options_for(instance, shape), std::move(daemon));
        if (!browser) {
            ADD_FAILURE() << browser.error().message;
            return nullptr;
        }
        return std::move(*browser);
    }

    std::shared_ptr<LoopbackDaemon> make_daemon(std::string address) {
        return std::make_shared<LoopbackDaemon>(network_, AddressSet{std::move(address)});
    }
};

// ═══════════════════════════════════════════════
// Setup
// ═══════════════════════════════════════════════

TEST_F(ServerBrowserIntegration, InvalidNamespaceFailsCreate) {
    auto daemon = make_daemon("10.0.0.1");
    BrowserOptions options;
    options.namespace_id = "-bad";

    auto browser = ServerBrowser::create(options, daemon);
    ASSERT_FALSE(browser.has_value());
    EXPECT_NE(browser.error().message.find("start"), std::string::npos);
    EXPECT_EQ(daemon->browse_calls(), 0u);
    EXPECT_TRUE(daemon->register_calls().empty());
}

TEST_F(ServerBrowserIntegration, MissingDaemonFailsCreate) {
    EXPECT_FALSE(ServerBrowser::create(BrowserOptions{}, nullptr).has_value());
}

TEST_F(ServerBrowserIntegration, IdleCycleChangesNothing) {
    auto browser = make_browser("1", make_daemon("10.0.0.1"));
    auto changed = browser->update();
    ASSERT_TRUE(changed.has_value());
    EXPECT_FALSE(*changed);
    EXPECT_FALSE(browser->is_searching());
    EXPECT_FALSE(browser->is_registered());
}

// ═══════════════════════════════════════════════
// Server and client
// ═══════════════════════════════════════════════

TEST_F(ServerBrowserIntegration, ClientDiscoversServer) {
    auto server = make_browser("100", make_daemon("192.168.1.10"));
    auto client = make_browser("200", make_daemon("192.168.1.20"));

    server->advertise(test_server());
    ASSERT_TRUE(server->update().has_value());
    EXPECT_TRUE(server->is_registered());

    client->search();
    auto changed = client->update();
    ASSERT_TRUE(changed.has_value());
    EXPECT_TRUE(*changed);
    EXPECT_TRUE(client->changed());
    EXPECT_TRUE(client->is_searching());

    const auto& servers = client->servers();
    ASSERT_EQ(servers.size(), 1u);
    const auto* found = servers.find("100._test-id._udp.local.");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->hostname, "host-100");
    EXPECT_EQ(found->port, 1234);
    EXPECT_EQ(found->addresses, AddressSet{"192.168.1.10"});
    EXPECT_EQ(found->metadata.get_or("name", ""), "Test Server");
}

TEST_F(ServerBrowserIntegration, ServerAndClientInOneProcess) {
    auto browser = make_browser("300", make_daemon("127.0.0.1"));

    browser->advertise(test_server());
    browser->search();
    auto changed = browser->update();
    ASSERT_TRUE(changed.has_value());
    EXPECT_TRUE(*changed);
    ASSERT_EQ(browser->servers().size(), 1u);
    EXPECT_TRUE(browser->servers().contains("300._test-id._udp.local."));
}

TEST_F(ServerBrowserIntegration, RepeatedAnnouncementsDoNotSignalChange) {
    auto server_daemon = make_daemon("192.168.1.10");
    auto server = make_browser("100", server_daemon);
    auto client = make_browser("200", make_daemon("192.168.1.20"));

    server->advertise(test_server());
    ASSERT_TRUE(server->update().has_value());
    client->search();
    ASSERT_TRUE(*client->update());

    for (int i = 0; i < 3; ++i) {
        server_daemon->announce_again();
        auto changed = client->update();
        ASSERT_TRUE(changed.has_value());
        EXPECT_FALSE(*changed);
    }
}

TEST_F(ServerBrowserIntegration, WithdrawnServerDisappears) {
    auto server = make_browser("100", make_daemon("192.168.1.10"));
    auto client = make_browser("200", make_daemon("192.168.1.20"));

    server->advertise(test_server());
    ASSERT_TRUE(server->update().has_value());
    client->search();
    ASSERT_TRUE(*client->update());

    server->withdraw();
    ASSERT_TRUE(server->update().has_value());
    EXPECT_FALSE(server->is_registered());

    auto changed = client->update();
    ASSERT_TRUE(changed.has_value());
    EXPECT_TRUE(*changed);
    EXPECT_TRUE(client->servers().is_empty());
}

TEST_F(ServerBrowserIntegration, ChangedRecordIsReResolved) {
    auto server = make_browser("100", make_daemon("192.168.1.10"));
    auto client = make_browser("200", make_daemon("192.168.1.20"));

    server->advertise(test_server(1234, "Before"));
    ASSERT_TRUE(server->update().has_value());
    client->search();
    ASSERT_TRUE(*client->update());

    server->advertise(test_server(1234, "After"));
    ASSERT_TRUE(server->update().has_value());

    ASSERT_TRUE(*client->update());
    ASSERT_EQ(client->servers().size(), 1u);
    EXPECT_EQ(client->servers().find("100._test-id._udp.local.")->metadata.get_or("name", ""),
              "After");
}

TEST_F(ServerBrowserIntegration, LastRegistrationTriggerWins) {
    auto daemon = make_daemon("192.168.1.10");
    auto server = make_browser("100", daemon);

    server->advertise(test_server());
    server->withdraw();
    ASSERT_TRUE(server->update().has_value());
    EXPECT_FALSE(server->is_registered());
    EXPECT_TRUE(daemon->register_calls().empty());

    server->withdraw();
    server->advertise(test_server(5555));
    ASSERT_TRUE(server->update().has_value());
    ASSERT_EQ(daemon->register_calls().size(), 1u);
    EXPECT_EQ(daemon->register_calls()[0].port, 5555);
}

TEST_F(ServerBrowserIntegration, NewSearchClearsListAndCountsAsChange) {
    auto server = make_browser("100", make_daemon("192.168.1.10"));
    auto client_daemon = make_daemon("192.168.1.20");
    auto client = make_browser("200", client_daemon);

    server->advertise(test_server());
    ASSERT_TRUE(server->update().has_value());
    client->search();
    ASSERT_TRUE(*client->update());

    client->search();
    client->search();
    auto changed = client->update();
    ASSERT_TRUE(changed.has_value());
    // Cleared, then refilled from the new browse in the same cycle.
    EXPECT_TRUE(*changed);
    EXPECT_EQ(client->servers().size(), 1u);
    EXPECT_EQ(client_daemon->browse_calls(), 2u);
}

TEST_F(ServerBrowserIntegration, ChangedCallbackFiresOncePerChangedCycle) {
    auto server_a = make_browser("100", make_daemon("192.168.1.10"));
    auto server_b = make_browser("101", make_daemon("192.168.1.11"));
    auto client = make_browser("200", make_daemon("192.168.1.20"));

    int calls = 0;
    size_t last_size = 0;
    client->on_servers_changed([&](const ServerList& servers) {
        ++calls;
        last_size = servers.size();
    });

    server_a->advertise(test_server(1000));
    server_b->advertise(test_server(2000));
    ASSERT_TRUE(server_a->update().has_value());
    ASSERT_TRUE(server_b->update().has_value());

    client->search();
    ASSERT_TRUE(client->update().has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(last_size, 2u);

    ASSERT_TRUE(client->update().has_value());
    EXPECT_EQ(calls, 1);
}

TEST_F(ServerBrowserIntegration, NameOnlyClientSeesFallback) {
    auto server = make_browser("100", make_daemon("192.168.1.10"));
    auto client = make_browser("200", make_daemon("192.168.1.20"), MetadataShape::NameOnly);

    server->advertise(DiscoverableServer{1234, ServerMetadata{{"map", "dust"}}});
    ASSERT_TRUE(server->update().has_value());
    client->search();
    ASSERT_TRUE(*client->update());

    const auto* found = client->servers().find("100._test-id._udp.local.");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->metadata.size(), 1u);
    EXPECT_EQ(found->metadata.get_or("name", ""), "Unknown Server");
}

TEST_F(ServerBrowserIntegration, DifferentNamespacesDoNotSeeEachOther) {
    auto server_daemon = make_daemon("192.168.1.10");
    BrowserOptions other = options_for("100");
    other.namespace_id = "other_game";
    auto server = ServerBrowser::create(other, server_daemon).value();
    auto client = make_browser("200", make_daemon("192.168.1.20"));

    server->advertise(test_server());
    ASSERT_TRUE(server->update().has_value());
    client->search();
    auto changed = client->update();
    ASSERT_TRUE(changed.has_value());
    EXPECT_FALSE(*changed);
    EXPECT_TRUE(client->servers().is_empty());
}

// ═══════════════════════════════════════════════
// Failures and logging
// ═══════════════════════════════════════════════

TEST_F(ServerBrowserIntegration, BrowseFailureIsReturnedFromUpdate) {
    auto daemon = make_daemon("192.168.1.20");
    auto client = make_browser("200", daemon);
    daemon->fail_next(LoopbackDaemon::Operation::Browse, "daemon unavailable");

    client->search();
    auto result = client->update();
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("daemon unavailable"), std::string::npos);
}

TEST_F(ServerBrowserIntegration, RegisterFailureIsReturnedFromUpdate) {
    auto daemon = make_daemon("192.168.1.10");
    auto server = make_browser("100", daemon);
    daemon->fail_next(LoopbackDaemon::Operation::Register, "name conflict");

    server->advertise(test_server());
    auto result = server->update();
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("name conflict"), std::string::npos);
    EXPECT_FALSE(server->is_registered());
}

TEST_F(ServerBrowserIntegration, MonitorEventsAreLoggedWhileRegistered) {
    auto sink = std::make_unique<MemorySink>();
    auto buffer = sink->buffer();
    Logger logger(std::move(sink), LogLevel::Debug);

    auto browser = ServerBrowser::create(options_for("100"),
                                         make_daemon("192.168.1.10"), &logger).value();
    browser->advertise(test_server());
    ASSERT_TRUE(browser->update().has_value());

    // IpAdded at open, then Announce for the registration.
    EXPECT_EQ(browser->event_log().total_drained(), 2u);

    bool saw_announce = false;
    for (const auto& line : buffer->lines) {
        if (line.find(R"("component":"daemon")") != std::string::npos
            && line.find("Announce(100._test-id._udp.local.") != std::string::npos) {
            saw_announce = true;
        }
    }
    EXPECT_TRUE(saw_announce);
}

TEST(OptionsFromConfigTest, CopiesBrowserSection) {
    BrowserConfig config;
    config.service_namespace = "my_game";
    config.metadata = MetadataShape::NameOnly;
    config.name_key = "title";
    config.fallback_name = "Untitled";
    config.merge_policy = MergePolicy::AddressUnion;

    auto options = options_from_config(config);
    EXPECT_EQ(options.namespace_id, "my_game");
    EXPECT_EQ(options.metadata, MetadataShape::NameOnly);
    EXPECT_EQ(options.name_key, "title");
    EXPECT_EQ(options.fallback_name, "Untitled");
    EXPECT_EQ(options.merge_policy, MergePolicy::AddressUnion);
    EXPECT_FALSE(options.identity.has_value());
}

// ═══════════════════════════════════════════════
// UDP multicast (skipped where multicast is unavailable)
// ═══════════════════════════════════════════════

TEST(UdpServiceDaemonIntegration, ServerAndClientOverMulticast) {
    UdpDaemonConfig config;
    config.port = 5399;
    config.announce_interval_ms = 100;
    auto daemon = UdpServiceDaemon::create(config);
    if (!daemon) {
        GTEST_SKIP() << "multicast unavailable: " << daemon.error().message;
    }

    auto browser = ServerBrowser::create(options_for("udp-1"), *daemon).value();
    browser->advertise(test_server());
    browser->search();

    bool found = false;
    for (int i = 0; i < 30 && !found; ++i) {
        auto changed = browser->update();
        if (!changed) {
            (*daemon)->shutdown();
            GTEST_SKIP() << "multicast send failed: " << changed.error().message;
        }
        found = browser->servers().contains("udp-1._test-id._udp.local.");
        if (!found) std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (!found) {
        (*daemon)->shutdown();
        GTEST_SKIP() << "multicast loopback not delivered on this host";
    }

    browser->withdraw();
    ASSERT_TRUE(browser->update().has_value());
    (*daemon)->shutdown();
}

TEST(UdpServiceDaemonIntegration, ZeroAnnounceIntervalFailsCreate) {
    UdpDaemonConfig config;
    config.port = 5399;
    config.announce_interval_ms = 0;
    auto daemon = UdpServiceDaemon::create(config);
    ASSERT_FALSE(daemon.has_value());
    EXPECT_NE(daemon.error().message.find("announce_interval_ms"), std::string::npos);
}

TEST(UdpServiceDaemonIntegration, RegisterRacingShutdownNeverSucceedsAfterClose) {
    UdpDaemonConfig config;
    config.port = 5399;
    auto daemon = UdpServiceDaemon::create(config);
    if (!daemon) {
        GTEST_SKIP() << "multicast unavailable: " << daemon.error().message;
    }

    ServiceDescriptor service;
    service.service_type = "_test-id._udp.local.";
    service.hostname = "host-race.local.";
    service.port = 1234;

    std::jthread registrar([&] {
        for (int i = 0; i < 200; ++i) {
            service.instance_name = "race-" + std::to_string(i);
            auto registered = (*daemon)->register_service(service);
            if (!registered) return;
        }
    });
    (*daemon)->shutdown();
    registrar.join();

    service.instance_name = "after-shutdown";
    EXPECT_FALSE((*daemon)->register_service(service).has_value());
}
