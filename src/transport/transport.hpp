/**
 * @file transport.hpp
 * @brief Downstream transport boundary and its StatsD implementations.
 * @author Dimitris Kafetzis
 *
 * The aggregation buffer hands one fully merged Event per key per flush to an
 * ITransport. Transports are I/O-bound and configured once at startup, so they
 * use virtual dispatch like ILogSink.
 *
 * UdpTransport wire format (one datagram per packet):
 *   <prefix><name>:<value>|<type>\n<prefix><name>:<value>|<type>...
 * Lines of one event are packed into as few datagrams as fit max_packet_size.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "event/event.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace buffered_statsd {

// ─────────────────────────────────────────────
// ITransport
// ─────────────────────────────────────────────

/**
 * @brief Sends aggregated events downstream.
 *
 * send() is called concurrently from send-pool workers during a flush and
 * must be thread-safe. close() is called once, after the last flush.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual Result<void> send(const Event& event) = 0;
    virtual Result<void> close() = 0;
};

// ─────────────────────────────────────────────
// UdpTransport
// ─────────────────────────────────────────────

/**
 * @brief StatsD client over a connected IPv4 UDP socket.
 */
class UdpTransport : public ITransport {
public:
    explicit UdpTransport(std::string prefix = {}, uint32_t max_packet_size = 1432);
    ~UdpTransport() override;

    // Non-copyable
    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    Result<void> connect(const std::string& address, uint16_t port);

    Result<void> send(const Event& event) override;
    Result<void> close() override;

    [[nodiscard]] bool is_connected() const noexcept;
    [[nodiscard]] uint64_t packets_sent() const noexcept { return packets_sent_.load(); }

    /// Group lines into '\n'-joined payloads no larger than @p max_packet_size.
    /// A single line longer than the limit travels alone.
    [[nodiscard]] static std::vector<std::string> pack_lines(
        const std::vector<std::string>& lines, size_t max_packet_size);

private:
    std::string prefix_;
    uint32_t max_packet_size_;
    int fd_ = -1;
    std::atomic<uint64_t> packets_sent_{0};
};

// ─────────────────────────────────────────────
// LogTransport
// ─────────────────────────────────────────────

/**
 * @brief Writes rendered StatsD lines to a Logger, for demos and dry runs.
 */
class LogTransport : public ITransport {
public:
    explicit LogTransport(Logger logger, std::string prefix = {});

    Result<void> send(const Event& event) override;
    Result<void> close() override;

private:
    Logger logger_;
    std::string prefix_;
    std::atomic<bool> closed_{false};
};

}  // namespace buffered_statsd
