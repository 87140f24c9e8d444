/**
 * @file main.cpp
 * @brief buffered_statsd entry point: a local aggregating StatsD relay.
 * @author Dimitris Kafetzis
 *
 * Reads StatsD lines ("name:value|type") from stdin, merges them in memory
 * and forwards one aggregate per metric per flush interval:
 *   Config → Logger → Transport → BufferedClient → stdin loop → close
 *
 * --demo instead generates a concurrent synthetic load and exits.
 */

#include "client/buffered_client.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "event/event.hpp"
#include "telemetry/json_sink.hpp"
#include "transport/transport.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace buffered_statsd;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

/// No SA_RESTART: a blocked stdin read returns on SIGINT/SIGTERM.
void install_signal_handlers() {
    struct sigaction action{};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    ::sigaction(SIGINT, &action, nullptr);
    ::sigaction(SIGTERM, &action, nullptr);
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string host;
    uint16_t port = 0;
    std::string prefix;
    bool prefix_set = false;
    uint32_t interval_ms = 0;
    std::string log_dir;
    bool demo_mode = false;
    bool dry_run = false;
};

void print_usage() {
    std::cout << "Usage: buffered_statsd [OPTIONS] < metrics.txt\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --host <ipv4>        StatsD host\n"
              << "  --port <port>        StatsD port\n"
              << "  --prefix <prefix>    Prefix prepended to every metric name\n"
              << "  --interval-ms <ms>   Flush interval\n"
              << "  --log-dir <path>     Log output directory (default: stdout)\n"
              << "  --dry-run            Log aggregated lines instead of sending them\n"
              << "  --demo               Generate a synthetic concurrent load, then exit\n"
              << "  --help, -h           Show this help message\n";
}

/// Exits with status 2 when @p text is not an integer in [0, max].
uint64_t numeric_arg(const std::string& flag, const char* text, uint64_t max) {
    auto value = parse_unsigned(text, max);
    if (!value) {
        std::cerr << flag << ": " << value.error().message << "\n";
        print_usage();
        std::exit(2);
    }
    return *value;
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            args.host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            args.port = static_cast<uint16_t>(numeric_arg(arg, argv[++i], UINT16_MAX));
        } else if (arg == "--prefix" && i + 1 < argc) {
            args.prefix = argv[++i];
            args.prefix_set = true;
        } else if (arg == "--interval-ms" && i + 1 < argc) {
            args.interval_ms = static_cast<uint32_t>(numeric_arg(arg, argv[++i], UINT32_MAX));
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--dry-run") {
            args.dry_run = true;
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

/**
 * @brief Hammer a handful of keys from several threads, then close.
 */
void run_demo(BufferedClient& client, Logger& logger) {
    logger.info("=== Demo Mode ===");

    constexpr int kThreads = 4;
    constexpr int kIterations = 10000;

    std::vector<std::jthread> producers;
    for (int t = 0; t < kThreads; ++t) {
        producers.emplace_back([&client, t] {
            for (int i = 0; i < kIterations && !g_shutdown_requested; ++i) {
                if (!client.increment("demo.requests")) return;
                if (!client.timing("demo.latency", std::chrono::microseconds(100 + (i % 900)))) return;
                if (i % 100 == 0
                    && !client.gauge("demo.worker." + std::to_string(t) + ".progress", i)) {
                    return;
                }
            }
        });
    }
    producers.clear();  // join

    auto stats = client.stats();
    logger.info("Demo submitted " + std::to_string(stats.events_submitted) + " events, "
                + std::to_string(stats.events_merged) + " merged in memory");
}

/**
 * @brief Feed stdin lines into the client until EOF or a signal.
 */
void relay_stdin(BufferedClient& client, Logger& logger) {
    std::string line;
    uint64_t accepted = 0;
    uint64_t rejected = 0;

    while (!g_shutdown_requested && std::getline(std::cin, line)) {
        if (line.empty()) continue;
        auto event = parse_line(line);
        if (!event) {
            ++rejected;
            logger.warn(event.error().message);
            continue;
        }
        if (auto result = client.record(std::move(*event)); !result) {
            logger.error("Submit failed: " + result.error().message);
            break;
        }
        ++accepted;
    }

    logger.info("Input finished: " + std::to_string(accepted) + " lines accepted, "
                + std::to_string(rejected) + " rejected");
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.host.empty()) config.statsd.host = args.host;
    if (args.port != 0) config.statsd.port = args.port;
    if (args.prefix_set) config.statsd.prefix = args.prefix;
    if (args.interval_ms != 0) config.buffer.flush_interval_ms = args.interval_ms;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 2;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "buffered_statsd",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    Logger logger(std::move(log_sink), level, "main");
    logger.info("buffered_statsd starting...");

    install_signal_handlers();

    // ── Initialize Transport ─────────────────
    std::shared_ptr<ITransport> transport;
    if (args.dry_run) {
        transport = std::make_shared<LogTransport>(logger.with_component("dry_run"),
                                                   config.statsd.prefix);
        logger.info("Dry run: aggregated lines are logged, not sent");
    } else {
        auto udp = std::make_shared<UdpTransport>(config.statsd.prefix,
                                                  config.statsd.max_packet_size);
        if (auto connected = udp->connect(config.statsd.host, config.statsd.port); !connected) {
            logger.error("Cannot reach StatsD: " + connected.error().message);
            return 1;
        }
        logger.info("Sending to " + config.statsd.host + ":"
                    + std::to_string(config.statsd.port));
        transport = std::move(udp);
    }

    // ── Initialize Client ────────────────────
    int exit_code = 0;
    BufferedClient client(config.buffer, transport, logger, [&logger](const Error& fault) {
        logger.error("Aggregation stopped: " + fault.message);
    });

    if (args.demo_mode) {
        run_demo(client, logger);
    } else {
        relay_stdin(client, logger);
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Flushing pending stats...");
    if (auto closed = client.close(); !closed) {
        logger.error("Close failed: " + closed.error().message);
        exit_code = 1;
    }

    auto stats = client.stats();
    logger.info("buffered_statsd stopped: " + std::to_string(stats.sends) + " sends, "
                + std::to_string(stats.send_failures) + " failed, "
                + std::to_string(stats.kind_mismatches) + " kind mismatches");
    logger.flush();
    return exit_code;
}
