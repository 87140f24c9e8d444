/**
 * @file types.hpp
 * @brief Fundamental types used throughout BufferedStatsd.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace buffered_statsd {

// ─────────────────────────────────────────────
// Identity / Time Types
// ─────────────────────────────────────────────

using MetricName = std::string;
using MetricKey = std::string;              ///< Identity key in the aggregation map
using Duration = std::chrono::microseconds;
using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

// ─────────────────────────────────────────────
// Metric Kind
// ─────────────────────────────────────────────

/**
 * @brief Discriminator for the closed set of event variants.
 *
 * Order matches the alternatives of the Event variant (event/event.hpp).
 */
enum class MetricKind : uint8_t {
    Increment,
    Gauge,
    GaugeDelta,
    Absolute,
    Total,
    Timing
};

[[nodiscard]] constexpr std::string_view to_string(MetricKind kind) noexcept {
    switch (kind) {
        case MetricKind::Increment:  return "increment";
        case MetricKind::Gauge:      return "gauge";
        case MetricKind::GaugeDelta: return "gauge_delta";
        case MetricKind::Absolute:   return "absolute";
        case MetricKind::Total:      return "total";
        case MetricKind::Timing:     return "timing";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Buffer State
// ─────────────────────────────────────────────

enum class BufferState : uint8_t {
    Running,       ///< Accepting events, flushing on every tick
    Draining,      ///< Close request received, final flush in progress
    Stopped        ///< Loop exited (after close or after a fault)
};

[[nodiscard]] constexpr std::string_view to_string(BufferState state) noexcept {
    switch (state) {
        case BufferState::Running:  return "running";
        case BufferState::Draining: return "draining";
        case BufferState::Stopped:  return "stopped";
    }
    return "unknown";
}

}  // namespace buffered_statsd
