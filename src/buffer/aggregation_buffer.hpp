/**
 * @file aggregation_buffer.hpp
 * @brief In-memory event aggregation in front of a StatsD transport.
 * @author Dimitris Kafetzis
 *
 * A single loop thread owns the key → Event map. Producers, flush requests
 * and the close request all travel through one bounded FIFO channel, so the
 * map needs no lock and a close request is handled strictly after every
 * message enqueued before it.
 *
 *   producers ──push──▶ Channel<Message> ──▶ loop thread ──flush──▶ ThreadPool ──▶ ITransport
 *                                              ▲ tick deadline
 *
 * On every tick the loop sends each entry concurrently through the send
 * pool, waits for all sends and clears the map. A failed send is logged and
 * dropped, never retried.
 */

#pragma once

#include "buffer/channel.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "event/event.hpp"
#include "executor/thread_pool.hpp"
#include "transport/transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>

namespace buffered_statsd {

/// Invoked on the loop thread after a fault has been flushed and recorded.
using FaultHandler = std::function<void(const Error&)>;

/**
 * @brief Counters maintained by the buffer; safe to read from any thread.
 */
struct BufferStats {
    uint64_t events_submitted{0};
    uint64_t events_merged{0};        ///< Submitted events folded into an existing entry
    uint64_t kind_mismatches{0};      ///< Events rejected because the key holds another kind
    uint64_t flushes{0};              ///< Non-empty flushes
    uint64_t sends{0};
    uint64_t send_failures{0};
};

class AggregationBuffer {
public:
    AggregationBuffer(const BufferConfig& config,
                      std::shared_ptr<ITransport> transport,
                      Logger logger,
                      FaultHandler on_fault = {});
    ~AggregationBuffer();

    // Non-copyable
    AggregationBuffer(const AggregationBuffer&) = delete;
    AggregationBuffer& operator=(const AggregationBuffer&) = delete;

    /**
     * @brief Enqueue an event for merging. Blocks while the channel is full.
     * @return ErrorCode::Closed once close() was called or the loop faulted.
     */
    Result<void> submit(Event event);

    /**
     * @brief Flush everything enqueued so far, without waiting for the tick.
     * @return The first send error of that flush, if any.
     */
    Result<void> flush();

    /**
     * @brief Drain, flush and stop the loop, then close the transport.
     *
     * The final flush error takes priority; a transport close error is
     * appended to its message, or returned alone when the flush succeeded.
     * After a loop fault it waits for the best-effort flush to finish, then
     * returns the fault.
     */
    Result<void> close();

    [[nodiscard]] BufferState state() const noexcept { return state_.load(); }
    [[nodiscard]] BufferStats stats() const noexcept;
    [[nodiscard]] std::chrono::milliseconds flush_interval() const noexcept { return flush_interval_; }

private:
    using Reply = std::shared_ptr<std::promise<Result<void>>>;

    struct FlushRequest { Reply reply; };
    struct CloseRequest { Reply reply; };

    using Message = std::variant<Event, FlushRequest, CloseRequest>;

    void run();
    void process_messages();
    void handle_fault(const std::string& what);
    void mark_stopped();

    void apply(Event event);
    Result<void> flush_events();
    Result<void> close_transport();

    Result<void> await_reply(Reply reply, std::optional<std::chrono::milliseconds> timeout);

    // Configuration
    std::chrono::milliseconds flush_interval_;
    std::optional<std::chrono::milliseconds> close_timeout_;

    std::shared_ptr<ITransport> transport_;
    Logger logger_;
    FaultHandler on_fault_;

    Channel<Message> channel_;
    ThreadPool send_pool_;

    // Loop-thread only
    std::unordered_map<MetricKey, Event> events_;
    Reply in_flight_;

    std::atomic<BufferState> state_{BufferState::Running};
    std::atomic<bool> transport_closed_{false};

    mutable std::mutex fault_mutex_;
    std::optional<Error> fault_;

    // Ready once the loop has finished its last flush and will touch nothing else.
    std::promise<void> loop_stopped_;
    std::shared_future<void> loop_stopped_future_{loop_stopped_.get_future().share()};

    std::atomic<uint64_t> events_submitted_{0};
    std::atomic<uint64_t> events_merged_{0};
    std::atomic<uint64_t> kind_mismatches_{0};
    std::atomic<uint64_t> flushes_{0};
    std::atomic<uint64_t> sends_{0};
    std::atomic<uint64_t> send_failures_{0};

    std::jthread loop_thread_;
};

}  // namespace buffered_statsd
