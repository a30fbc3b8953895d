/**
 * @file config.hpp
 * @brief Host configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/logger.hpp"
#include "core/result.hpp"
#include "discovery/peer_reconciler.hpp"
#include "discovery/server_metadata.hpp"

namespace server_browser {

enum class MetadataShape : uint8_t {
    Full,       ///< every TXT property
    NameOnly    ///< a single display-name property with a fallback
};

enum class TransportKind : uint8_t {
    Udp,
    Loopback
};

struct BrowserConfig {
    std::string service_namespace = "test-id";
    MetadataShape metadata = MetadataShape::Full;
    std::string name_key = "name";
    std::string fallback_name = "Unknown Server";
    MergePolicy merge_policy = MergePolicy::Overwrite;
};

struct ServerConfig {
    bool enabled = false;
    uint16_t port = 1234;
    ServerMetadata metadata;
};

struct ClientConfig {
    bool enabled = true;
    bool search_on_start = true;
};

struct TransportConfig {
    TransportKind kind = TransportKind::Udp;
    std::string multicast_group = "239.255.42.99";
    uint16_t port = 5354;
    uint32_t announce_interval_ms = 1000;
    uint32_t peer_timeout_ms = 3500;
};

struct LoopConfig {
    uint32_t tick_interval_ms = 100;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< empty = stdout
    LogLevel log_level = LogLevel::Info;
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level host configuration.
 */
struct Config {
    BrowserConfig browser;
    ServerConfig server;
    ClientConfig client;
    TransportConfig transport;
    LoopConfig loop;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Unknown enumeration values and
 * out-of-range ports are errors.
 */
Result<Config> load_config(const std::filesystem::path& path);

Config default_config();

Result<MetadataShape> parse_metadata_shape(std::string_view text);
Result<MergePolicy> parse_merge_policy(std::string_view text);
Result<TransportKind> parse_transport_kind(std::string_view text);

}  // namespace server_browser
