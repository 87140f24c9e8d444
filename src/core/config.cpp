/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <charconv>
#include <limits>
#include <system_error>

namespace buffered_statsd {

namespace {

constexpr uint32_t MIN_PACKET_SIZE = 64;
constexpr uint32_t MAX_PACKET_SIZE = 65507;  // IPv4 UDP payload limit

/// Reads table.key into @p out if present; rejects values T cannot hold.
template <typename T>
Result<void> read_unsigned(toml::node_view<toml::node> table, std::string_view section,
                           std::string_view key, T& out) {
    auto node = table[key];
    if (!node) return ok();

    constexpr auto limit = static_cast<uint64_t>(std::numeric_limits<T>::max());
    auto name = std::string(section) + "." + std::string(key);
    auto value = node.value<int64_t>();
    if (!value) {
        return Error{name + " must be an integer", ErrorCode::Config};
    }
    if (*value < 0 || static_cast<uint64_t>(*value) > limit) {
        return Error{name + " out of range [0, " + std::to_string(limit)
                     + "]: " + std::to_string(*value), ErrorCode::Config};
    }
    out = static_cast<T>(*value);
    return ok();
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string(), ErrorCode::Config};
    }

    Config config;
    try {
        auto tbl = toml::parse_file(path.string());

        // [buffer]
        if (auto buffer = tbl["buffer"]; buffer.is_table()) {
            for (auto result : {
                     read_unsigned(buffer, "buffer", "flush_interval_ms", config.buffer.flush_interval_ms),
                     read_unsigned(buffer, "buffer", "queue_capacity", config.buffer.queue_capacity),
                     read_unsigned(buffer, "buffer", "send_workers", config.buffer.send_workers),
                     read_unsigned(buffer, "buffer", "close_timeout_ms", config.buffer.close_timeout_ms)}) {
                if (!result) return result.error();
            }
        }

        // [statsd]
        if (auto statsd = tbl["statsd"]; statsd.is_table()) {
            config.statsd.host = statsd["host"].value_or(std::string{"127.0.0.1"});
            config.statsd.prefix = statsd["prefix"].value_or(std::string{});
            for (auto result : {
                     read_unsigned(statsd, "statsd", "port", config.statsd.port),
                     read_unsigned(statsd, "statsd", "max_packet_size", config.statsd.max_packet_size)}) {
                if (!result) return result.error();
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            for (auto result : {
                     read_unsigned(telemetry, "telemetry", "max_file_size_mb", config.telemetry.max_file_size_mb),
                     read_unsigned(telemetry, "telemetry", "rotate_count", config.telemetry.rotate_count)}) {
                if (!result) return result.error();
            }
        }

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()},
                     ErrorCode::Config};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Result<void> validate_config(const Config& config) {
    if (config.buffer.flush_interval_ms == 0) {
        return Error{"buffer.flush_interval_ms must be positive", ErrorCode::Config};
    }
    if (config.buffer.queue_capacity == 0) {
        return Error{"buffer.queue_capacity must be positive", ErrorCode::Config};
    }
    if (config.statsd.port == 0) {
        return Error{"statsd.port must be non-zero", ErrorCode::Config};
    }
    if (config.statsd.max_packet_size < MIN_PACKET_SIZE
        || config.statsd.max_packet_size > MAX_PACKET_SIZE) {
        return Error{"statsd.max_packet_size out of range ["
                     + std::to_string(MIN_PACKET_SIZE) + ", "
                     + std::to_string(MAX_PACKET_SIZE) + "]", ErrorCode::Config};
    }
    if (auto level = parse_log_level(config.telemetry.log_level); !level) {
        return level.error();
    }
    return ok();
}

Result<uint64_t> parse_unsigned(std::string_view text, uint64_t max) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec == std::errc::invalid_argument || ptr != text.data() + text.size()) {
        return Error{"Not a non-negative integer: '" + std::string(text) + "'", ErrorCode::Config};
    }
    if (ec == std::errc::result_out_of_range || value > max) {
        return Error{"Value out of range [0, " + std::to_string(max) + "]: '"
                     + std::string(text) + "'", ErrorCode::Config};
    }
    return value;
}

Config default_config() {
    return Config{};
}

}  // namespace buffered_statsd
