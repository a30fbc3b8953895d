/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <limits>

namespace server_browser {

namespace {

Result<uint16_t> read_port(const toml::node_view<toml::node>& node, uint16_t fallback,
                           std::string_view key) {
    auto value = node.value_or(int64_t{fallback});
    if (value < 0 || value > 65535) {
        return Error{std::string{key} + " out of range: " + std::to_string(value)};
    }
    return static_cast<uint16_t>(value);
}

/// Intervals and timeouts must be positive and fit in 32 bits.
Result<uint32_t> read_interval(const toml::node_view<toml::node>& node, uint32_t fallback,
                               std::string_view key) {
    auto value = node.value_or(int64_t{fallback});
    if (value <= 0 || value > int64_t{std::numeric_limits<uint32_t>::max()}) {
        return Error{std::string{key} + " must be a positive number of milliseconds, got "
                     + std::to_string(value)};
    }
    return static_cast<uint32_t>(value);
}

}  // anonymous namespace

Result<MetadataShape> parse_metadata_shape(std::string_view text) {
    if (text == "full") return MetadataShape::Full;
    if (text == "name") return MetadataShape::NameOnly;
    return Error{"unknown metadata shape '" + std::string{text} + "' (expected full|name)"};
}

Result<MergePolicy> parse_merge_policy(std::string_view text) {
    if (text == "overwrite") return MergePolicy::Overwrite;
    if (text == "union") return MergePolicy::AddressUnion;
    return Error{"unknown merge policy '" + std::string{text} + "' (expected overwrite|union)"};
}

Result<TransportKind> parse_transport_kind(std::string_view text) {
    if (text == "udp") return TransportKind::Udp;
    if (text == "loopback") return TransportKind::Loopback;
    return Error{"unknown transport '" + std::string{text} + "' (expected udp|loopback)"};
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [browser]
        if (auto browser = tbl["browser"]; browser.is_table()) {
            config.browser.service_namespace =
                browser["namespace"].value_or(std::string{config.browser.service_namespace});
            config.browser.name_key = browser["name_key"].value_or(std::string{config.browser.name_key});
            config.browser.fallback_name =
                browser["fallback_name"].value_or(std::string{config.browser.fallback_name});

            if (auto shape = browser["metadata"].value<std::string>()) {
                auto parsed = parse_metadata_shape(*shape);
                if (!parsed) return parsed.error();
                config.browser.metadata = *parsed;
            }
            if (auto policy = browser["merge_policy"].value<std::string>()) {
                auto parsed = parse_merge_policy(*policy);
                if (!parsed) return parsed.error();
                config.browser.merge_policy = *parsed;
            }
        }

        // [server]
        if (auto server = tbl["server"]; server.is_table()) {
            config.server.enabled = server["enabled"].value_or(false);
            auto port = read_port(server["port"], config.server.port, "server.port");
            if (!port) return port.error();
            config.server.port = *port;

            // [server.metadata]
            if (auto* metadata = server["metadata"].as_table()) {
                for (const auto& [key, value] : *metadata) {
                    if (auto text = value.value<std::string>()) {
                        config.server.metadata.set(key.str(), *text);
                    } else if (auto number = value.value<int64_t>()) {
                        config.server.metadata.set(key.str(), *number);
                    } else {
                        return Error{"server.metadata." + std::string{key.str()}
                                     + " must be a string or integer"};
                    }
                }
            }
        }

        // [client]
        if (auto client = tbl["client"]; client.is_table()) {
            config.client.enabled = client["enabled"].value_or(true);
            config.client.search_on_start =
                client["search_on_start"].value_or(true);
        }

        // [transport]
        if (auto transport = tbl["transport"]; transport.is_table()) {
            if (auto kind = transport["kind"].value<std::string>()) {
                auto parsed = parse_transport_kind(*kind);
                if (!parsed) return parsed.error();
                config.transport.kind = *parsed;
            }
            config.transport.multicast_group =
                transport["multicast_group"].value_or(std::string{config.transport.multicast_group});
            auto port = read_port(transport["port"], config.transport.port, "transport.port");
            if (!port) return port.error();
            config.transport.port = *port;
            auto announce = read_interval(transport["announce_interval_ms"],
                                          config.transport.announce_interval_ms,
                                          "transport.announce_interval_ms");
            if (!announce) return announce.error();
            config.transport.announce_interval_ms = *announce;
            auto timeout = read_interval(transport["peer_timeout_ms"],
                                         config.transport.peer_timeout_ms,
                                         "transport.peer_timeout_ms");
            if (!timeout) return timeout.error();
            config.transport.peer_timeout_ms = *timeout;
        }

        // [loop]
        if (auto loop = tbl["loop"]; loop.is_table()) {
            auto tick = read_interval(loop["tick_interval_ms"], config.loop.tick_interval_ms,
                                      "loop.tick_interval_ms");
            if (!tick) return tick.error();
            config.loop.tick_interval_ms = *tick;
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            if (auto level = telemetry["log_level"].value<std::string>()) {
                auto parsed = parse_log_level(*level);
                if (!parsed) return parsed.error();
                config.telemetry.log_level = *parsed;
            }
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace server_browser
