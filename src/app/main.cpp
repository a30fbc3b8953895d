/**
 * @file main.cpp
 * @brief ServerBrowser demo host.
 *
 * Runs the discovery core in a fixed-rate loop, the way a game would call it
 * once per frame. Depending on flags the process advertises a server,
 * browses for servers, or both:
 *
 *   server_browser --server                 advertise "Test Server" on port 1234
 *   server_browser --client                 print the server list when it changes
 *   server_browser --server --client        both, in one process
 */

#include "browser/server_browser.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "telemetry/log_sinks.hpp"
#include "transport/loopback_daemon.hpp"
#include "transport/udp_service_daemon.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace server_browser;

namespace {

constexpr std::string_view COMPONENT = "app";

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║          ServerBrowser v1.0.0             ║
  ║   LAN server discovery over multicast     ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string namespace_id;
    std::optional<bool> server;
    std::optional<bool> client;
    uint16_t port = 0;
    std::string name;
    bool loopback = false;
    std::string log_dir;
    std::string log_level;
    uint64_t cycles = 0;    ///< 0 = run until signalled
};

template <typename T>
bool parse_number(const char* text, T& out) {
    std::string_view view{text};
    auto [ptr, ec] = std::from_chars(view.data(), view.data() + view.size(), out);
    return ec == std::errc{} && ptr == view.data() + view.size();
}

void print_usage() {
    std::cout << "Usage: server_browser [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --namespace <id>     Application namespace shared by servers and clients\n"
              << "  --server             Advertise a server\n"
              << "  --client             Search for servers and print the list\n"
              << "  --port <port>        Advertised server port\n"
              << "  --name <name>        Advertised server name\n"
              << "  --loopback           Use the in-process transport instead of UDP multicast\n"
              << "  --log-dir <path>     Log output directory (default: stdout)\n"
              << "  --log-level <level>  debug | info | warn | error\n"
              << "  --cycles <n>         Stop after n update cycles\n"
              << "  --help, -h           Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--namespace" && i + 1 < argc) {
            args.namespace_id = argv[++i];
        } else if (arg == "--server") {
            args.server = true;
        } else if (arg == "--client") {
            args.client = true;
        } else if (arg == "--port" && i + 1 < argc) {
            if (!parse_number(argv[++i], args.port)) {
                return Error{"invalid --port value: " + std::string{argv[i]}};
            }
        } else if (arg == "--name" && i + 1 < argc) {
            args.name = argv[++i];
        } else if (arg == "--loopback") {
            args.loopback = true;
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--cycles" && i + 1 < argc) {
            if (!parse_number(argv[++i], args.cycles)) {
                return Error{"invalid --cycles value: " + std::string{argv[i]}};
            }
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            return Error{"unknown argument: " + arg};
        }
    }
    return args;
}

Result<std::shared_ptr<IServiceDaemon>> make_daemon(const TransportConfig& transport) {
    if (transport.kind == TransportKind::Loopback) {
        return std::shared_ptr<IServiceDaemon>{std::make_shared<LoopbackDaemon>()};
    }

    UdpDaemonConfig udp;
    udp.multicast_group = transport.multicast_group;
    udp.port = transport.port;
    udp.announce_interval_ms = transport.announce_interval_ms;
    udp.peer_timeout_ms = transport.peer_timeout_ms;

    auto daemon = UdpServiceDaemon::create(std::move(udp));
    if (!daemon) return daemon.error();
    return std::shared_ptr<IServiceDaemon>{std::move(*daemon)};
}

void print_servers(const ServerList& servers, Logger& logger) {
    if (servers.is_empty()) {
        logger.info(COMPONENT, "No servers discovered");
        return;
    }

    logger.info(COMPONENT, "Discovered " + std::to_string(servers.size()) + " servers:");
    for (const auto& server : servers) {
        logger.info(COMPONENT, server.to_string());
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << args_result.error().message << std::endl;
        print_usage();
        return 2;
    }
    auto args = std::move(*args_result);

    // Load configuration; only a missing file falls back to defaults
    Config config = default_config();
    if (std::filesystem::exists(args.config_path)) {
        auto config_result = load_config(args.config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return 1;
        }
        config = std::move(*config_result);
    } else {
        std::cerr << "Config file " << args.config_path << " not found." << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }

    // Apply CLI overrides
    if (!args.namespace_id.empty()) config.browser.service_namespace = args.namespace_id;
    if (args.server || args.client) {
        config.server.enabled = args.server.value_or(false);
        config.client.enabled = args.client.value_or(false);
    }
    if (args.port != 0) config.server.port = args.port;
    if (!args.name.empty()) config.server.metadata.set("name", args.name);
    if (!config.server.metadata.contains("name")) config.server.metadata.set("name", "Test Server");
    if (args.loopback) config.transport.kind = TransportKind::Loopback;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) {
        auto level = parse_log_level(args.log_level);
        if (!level) {
            std::cerr << level.error().message << std::endl;
            return 2;
        }
        config.telemetry.log_level = *level;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "server_browser",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), config.telemetry.log_level);
    logger.info(COMPONENT, "ServerBrowser starting...");
    logger.info(COMPONENT, "Namespace: " + config.browser.service_namespace);
    logger.info(COMPONENT, std::string{"Transport: "}
                           + (config.transport.kind == TransportKind::Udp
                                  ? "udp " + config.transport.multicast_group + ":"
                                        + std::to_string(config.transport.port)
                                  : std::string{"loopback"}));

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Initialize Transport ─────────────────
    auto daemon = make_daemon(config.transport);
    if (!daemon) {
        logger.error(COMPONENT, "Could not start service daemon: " + daemon.error().message);
        return 1;
    }

    // ── Initialize Browser ───────────────────
    auto browser_result = ServerBrowser::create(options_from_config(config.browser), *daemon, &logger);
    if (!browser_result) {
        logger.error(COMPONENT, browser_result.error().message);
        (*daemon)->shutdown();
        return 1;
    }
    auto browser = std::move(*browser_result);

    if (config.server.enabled) {
        logger.info(COMPONENT, "Adding discoverable server");
        browser->advertise(DiscoverableServer{config.server.port, config.server.metadata});
    }
    if (config.client.enabled) {
        browser->on_servers_changed([&logger](const ServerList& servers) {
            print_servers(servers, logger);
        });
        if (config.client.search_on_start) browser->search();
    }

    // ── Main Loop ────────────────────────────
    logger.info(COMPONENT, "Entering main loop. Press Ctrl+C to shutdown.");

    int exit_code = 0;
    uint64_t cycle = 0;
    const auto tick = std::chrono::milliseconds(config.loop.tick_interval_ms);
    while (!g_shutdown_requested && (args.cycles == 0 || cycle < args.cycles)) {
        auto updated = browser->update();
        if (!updated) {
            logger.error(COMPONENT, "Update failed: " + updated.error().message);
            exit_code = 1;
            break;
        }
        if (cycle == 0 && config.client.enabled && !*updated) {
            print_servers(browser->servers(), logger);
        }

        std::this_thread::sleep_for(tick);
        ++cycle;
    }

    // ── Graceful Shutdown ────────────────────
    logger.info(COMPONENT, "Shutdown requested. Cleaning up...");
    browser->withdraw();
    if (auto final_update = browser->update(); !final_update) {
        logger.error(COMPONENT, "Withdraw failed: " + final_update.error().message);
        exit_code = 1;
    }
    (*daemon)->shutdown();

    logger.info(COMPONENT, "ServerBrowser stopped.");
    logger.flush();
    return exit_code;
}
