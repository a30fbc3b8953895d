/**
 * @file test_discovery_session.cpp
 * @brief Unit tests for DiscoverySession.
 */

#include "discovery/discovery_session.hpp"
#include "transport/loopback_daemon.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace server_browser;

namespace {

ServiceDescriptor make_service(const std::string& instance, Port port = 1234) {
    ServiceDescriptor service;
    service.service_type = "_test-id._udp.local.";
    service.instance_name = instance;
    service.hostname = "host-" + instance + ".local.";
    service.port = port;
    service.properties = ServerMetadata{{"name", "Server " + instance}};
    return service;
}

}  // namespace

class DiscoverySessionTest : public ::testing::Test {
protected:
    std::shared_ptr<LoopbackNetwork> network_ = std::make_shared<LoopbackNetwork>();
    std::shared_ptr<LoopbackDaemon> daemon_ = std::make_shared<LoopbackDaemon>(network_);
    std::shared_ptr<LoopbackDaemon> peer_ = std::make_shared<LoopbackDaemon>(network_);
    DiscoverySession session_{*ServiceNamespace::parse("test_id"), daemon_};
    PeerReconciler reconciler_;
};

TEST_F(DiscoverySessionTest, IdleUntilRequested) {
    EXPECT_FALSE(session_.is_active());
    EXPECT_FALSE(session_.search_pending());

    auto started = session_.start_pending(reconciler_);
    ASSERT_TRUE(started.has_value());
    EXPECT_FALSE(*started);
    EXPECT_EQ(daemon_->browse_calls(), 0u);
    EXPECT_FALSE(session_.poll(reconciler_));
}

TEST_F(DiscoverySessionTest, RequestsWithinOneCycleCoalesce) {
    session_.request_search();
    session_.request_search();
    session_.request_search();
    ASSERT_TRUE(session_.start_pending(reconciler_).has_value());

    EXPECT_EQ(daemon_->browse_calls(), 1u);
    EXPECT_TRUE(session_.is_active());
    EXPECT_FALSE(session_.search_pending());
}

TEST_F(DiscoverySessionTest, PollPicksUpExistingServers) {
    ASSERT_TRUE(peer_->register_service(make_service("1")).has_value());

    session_.request_search();
    ASSERT_TRUE(session_.start_pending(reconciler_).has_value());
    EXPECT_TRUE(session_.poll(reconciler_));
    EXPECT_EQ(reconciler_.servers().size(), 1u);

    // Nothing new on the next cycle.
    EXPECT_FALSE(session_.poll(reconciler_));
}

TEST_F(DiscoverySessionTest, NewSearchClearsAndReplacesStream) {
    ASSERT_TRUE(peer_->register_service(make_service("1")).has_value());
    session_.request_search();
    ASSERT_TRUE(session_.start_pending(reconciler_).has_value());
    ASSERT_TRUE(session_.poll(reconciler_));
    auto first_stream = session_.stream();

    session_.request_search();
    auto restarted = session_.start_pending(reconciler_);
    ASSERT_TRUE(restarted.has_value());
    EXPECT_TRUE(*restarted);   // non-empty list was cleared
    EXPECT_TRUE(reconciler_.servers().is_empty());
    EXPECT_NE(session_.stream(), first_stream);
    EXPECT_EQ(daemon_->browse_calls(), 2u);

    // The new browse re-reports what is still published.
    EXPECT_TRUE(session_.poll(reconciler_));
    EXPECT_EQ(reconciler_.servers().size(), 1u);
}

TEST_F(DiscoverySessionTest, DroppedStreamIsForgottenByNetwork) {
    session_.request_search();
    ASSERT_TRUE(session_.start_pending(reconciler_).has_value());
    EXPECT_EQ(network_->live_browser_count(), 1u);

    session_.request_search();
    ASSERT_TRUE(session_.start_pending(reconciler_).has_value());
    EXPECT_EQ(network_->live_browser_count(), 1u);
}

TEST_F(DiscoverySessionTest, BrowseFailureIsReturned) {
    daemon_->fail_next(LoopbackDaemon::Operation::Browse, "no daemon");
    session_.request_search();

    auto started = session_.start_pending(reconciler_);
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().message, "browse _test-id._udp.local.: no daemon");
    EXPECT_FALSE(session_.is_active());
}
