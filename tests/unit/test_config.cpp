/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace server_browser;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "sb_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.browser.service_namespace, "test-id");
    EXPECT_EQ(config.browser.metadata, MetadataShape::Full);
    EXPECT_EQ(config.browser.merge_policy, MergePolicy::Overwrite);
    EXPECT_FALSE(config.server.enabled);
    EXPECT_EQ(config.server.port, 1234);
    EXPECT_TRUE(config.client.enabled);
    EXPECT_EQ(config.transport.kind, TransportKind::Udp);
    EXPECT_EQ(config.transport.multicast_group, "239.255.42.99");
    EXPECT_EQ(config.transport.port, 5354);
    EXPECT_EQ(config.telemetry.log_level, LogLevel::Info);
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [browser]
        namespace = "my_game"
        metadata = "name"
        name_key = "title"
        fallback_name = "Nameless"
        merge_policy = "union"

        [server]
        enabled = true
        port = 7777

        [server.metadata]
        name = "Friday Night"
        max_players = 8

        [client]
        enabled = false
        search_on_start = false

        [transport]
        kind = "loopback"
        multicast_group = "239.255.0.1"
        port = 6000
        announce_interval_ms = 500
        peer_timeout_ms = 2000

        [loop]
        tick_interval_ms = 16

        [telemetry]
        log_dir = "/tmp/sb_logs"
        log_level = "debug"
        max_file_size_mb = 10
        rotate_count = 3
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.browser.service_namespace, "my_game");
    EXPECT_EQ(config.browser.metadata, MetadataShape::NameOnly);
    EXPECT_EQ(config.browser.name_key, "title");
    EXPECT_EQ(config.browser.fallback_name, "Nameless");
    EXPECT_EQ(config.browser.merge_policy, MergePolicy::AddressUnion);
    EXPECT_TRUE(config.server.enabled);
    EXPECT_EQ(config.server.port, 7777);
    EXPECT_EQ(config.server.metadata.get_or("name", ""), "Friday Night");
    EXPECT_EQ(config.server.metadata.get_or("max_players", ""), "8");
    EXPECT_FALSE(config.client.enabled);
    EXPECT_FALSE(config.client.search_on_start);
    EXPECT_EQ(config.transport.kind, TransportKind::Loopback);
    EXPECT_EQ(config.transport.multicast_group, "239.255.0.1");
    EXPECT_EQ(config.transport.port, 6000);
    EXPECT_EQ(config.transport.announce_interval_ms, 500u);
    EXPECT_EQ(config.transport.peer_timeout_ms, 2000u);
    EXPECT_EQ(config.loop.tick_interval_ms, 16u);
    EXPECT_EQ(config.telemetry.log_dir, "/tmp/sb_logs");
    EXPECT_EQ(config.telemetry.log_level, LogLevel::Debug);
    EXPECT_EQ(config.telemetry.max_file_size_mb, 10u);
    EXPECT_EQ(config.telemetry.rotate_count, 3u);
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [browser]
        namespace = "partial"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->browser.service_namespace, "partial");
    // Defaults for everything else
    EXPECT_EQ(result->server.port, 1234);
    EXPECT_EQ(result->transport.kind, TransportKind::Udp);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, UnknownMergePolicyIsRejected) {
    auto path = write_toml(R"(
        [browser]
        merge_policy = "newest"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("newest"), std::string::npos);
}

TEST_F(ConfigTest, UnknownTransportIsRejected) {
    auto path = write_toml(R"(
        [transport]
        kind = "bluetooth"
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, PortOutOfRangeIsRejected) {
    auto path = write_toml(R"(
        [server]
        port = 70000
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("server.port"), std::string::npos);
}

TEST_F(ConfigTest, ZeroAnnounceIntervalIsRejected) {
    auto path = write_toml(R"(
        [transport]
        announce_interval_ms = 0
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("transport.announce_interval_ms"), std::string::npos);
}

TEST_F(ConfigTest, NegativeTickIntervalIsRejected) {
    auto path = write_toml(R"(
        [loop]
        tick_interval_ms = -1
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("loop.tick_interval_ms"), std::string::npos);
}

TEST_F(ConfigTest, OversizedPeerTimeoutIsRejected) {
    auto path = write_toml(R"(
        [transport]
        peer_timeout_ms = 4294967296
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("transport.peer_timeout_ms"), std::string::npos);
}

TEST_F(ConfigTest, NonScalarMetadataIsRejected) {
    auto path = write_toml(R"(
        [server.metadata]
        tags = ["a", "b"]
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST(ConfigParseTest, EnumerationNames) {
    EXPECT_EQ(*parse_metadata_shape("full"), MetadataShape::Full);
    EXPECT_EQ(*parse_metadata_shape("name"), MetadataShape::NameOnly);
    EXPECT_FALSE(parse_metadata_shape("partial").has_value());

    EXPECT_EQ(*parse_merge_policy("overwrite"), MergePolicy::Overwrite);
    EXPECT_EQ(*parse_merge_policy("union"), MergePolicy::AddressUnion);

    EXPECT_EQ(*parse_transport_kind("udp"), TransportKind::Udp);
    EXPECT_EQ(*parse_transport_kind("loopback"), TransportKind::Loopback);
}
