/**
 * @file config.hpp
 * @brief Client/daemon configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/result.hpp"

namespace buffered_statsd {

struct BufferConfig {
    uint32_t flush_interval_ms = 1000;
    uint32_t queue_capacity = 100;
    uint32_t send_workers = 0;          ///< 0 = hardware_concurrency
    uint32_t close_timeout_ms = 0;      ///< 0 = wait forever

    [[nodiscard]] std::chrono::milliseconds flush_interval() const noexcept {
        return std::chrono::milliseconds(flush_interval_ms);
    }
};

struct StatsdConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8125;
    std::string prefix;
    uint32_t max_packet_size = 1432;    ///< Fits an Ethernet MTU with IP/UDP headers
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< Empty = stdout
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    BufferConfig buffer;
    StatsdConfig statsd;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file and validate it.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Check value ranges; returns ErrorCode::Config on the first violation.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Parse a decimal override (e.g. a CLI flag) in [0, max].
 * @return ErrorCode::Config for signs, trailing text or values above @p max.
 */
Result<uint64_t> parse_unsigned(std::string_view text, uint64_t max);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace buffered_statsd
