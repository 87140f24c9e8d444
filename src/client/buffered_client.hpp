/**
 * @file buffered_client.hpp
 * @brief Per-metric-kind façade over AggregationBuffer.
 * @author Dimitris Kafetzis
 *
 * Use when event frequency is too high to send one datagram per event and
 * sampling is not acceptable: every call is merged in memory and one
 * aggregate per metric name is sent per flush interval.
 *
 *   auto transport = std::make_shared<UdpTransport>("app.");
 *   transport->connect("127.0.0.1", 8125);
 *   BufferedClient stats(config.buffer, transport, logger);
 *   stats.increment("requests", 1);
 *   stats.timing("db.query", std::chrono::milliseconds(12));
 *   stats.close();
 *
 * All methods are thread-safe.
 */

#pragma once

#include "buffer/aggregation_buffer.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "transport/transport.hpp"

#include <cstdint>
#include <memory>
#include <string_view>

namespace buffered_statsd {

class BufferedClient {
public:
    BufferedClient(const BufferConfig& config,
                   std::shared_ptr<ITransport> transport,
                   const Logger& logger,
                   FaultHandler on_fault = {});

    // Non-copyable
    BufferedClient(const BufferedClient&) = delete;
    BufferedClient& operator=(const BufferedClient&) = delete;

    /// Counter increment; a zero delta enqueues nothing.
    Result<void> increment(std::string_view name, int64_t delta = 1);

    /// Counter decrement; a zero delta enqueues nothing, INT64_MIN is rejected.
    Result<void> decrement(std::string_view name, int64_t delta = 1);

    /// One duration sample.
    Result<void> timing(std::string_view name, Duration duration);

    /// Set a gauge. Zero is a valid reading and is always sent.
    Result<void> gauge(std::string_view name, int64_t value);

    /// Adjust a gauge relative to its current server-side value.
    Result<void> gauge_delta(std::string_view name, int64_t delta);

    /// Absolute-valued metric (not averaged by the collector).
    Result<void> absolute(std::string_view name, int64_t value);

    /// Continuously increasing total, e.g. read operations since boot.
    Result<void> total(std::string_view name, int64_t value);

    /// Pre-built event, e.g. one parsed from a StatsD line.
    Result<void> record(Event event);

    Result<void> flush();
    Result<void> close();

    [[nodiscard]] BufferStats stats() const noexcept { return buffer_.stats(); }
    [[nodiscard]] BufferState state() const noexcept { return buffer_.state(); }

private:
    AggregationBuffer buffer_;
};

}  // namespace buffered_statsd
