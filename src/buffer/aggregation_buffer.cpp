/**
 * @file aggregation_buffer.cpp
 * @brief AggregationBuffer processing loop, flush and shutdown protocol.
 * @author Dimitris Kafetzis
 */

#include "buffer/aggregation_buffer.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace buffered_statsd {

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

AggregationBuffer::AggregationBuffer(const BufferConfig& config,
                                     std::shared_ptr<ITransport> transport,
                                     Logger logger,
                                     FaultHandler on_fault)
    : flush_interval_(config.flush_interval())
    , transport_(std::move(transport))
    , logger_(std::move(logger))
    , on_fault_(std::move(on_fault))
    , channel_(config.queue_capacity)
    , send_pool_(config.send_workers) {
    if (!transport_) {
        throw std::invalid_argument("AggregationBuffer requires a transport");
    }
    if (flush_interval_.count() <= 0) {
        throw std::invalid_argument("AggregationBuffer requires a positive flush interval");
    }
    if (config.close_timeout_ms > 0) {
        close_timeout_ = std::chrono::milliseconds(config.close_timeout_ms);
    }

    loop_thread_ = std::jthread([this] { run(); });
    logger_.info("Aggregation buffer started (interval "
                 + std::to_string(flush_interval_.count()) + "ms, queue "
                 + std::to_string(channel_.capacity()) + ", send workers "
                 + std::to_string(send_pool_.thread_count()) + ")");
}

AggregationBuffer::~AggregationBuffer() {
    if (!channel_.closed()) {
        auto result = close();
        if (!result) {
            logger_.error("Close on destruction failed: " + result.error().message);
        }
    }

    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    // Loop has exited, so the transport can no longer be in use by a flush.
    if (auto result = close_transport(); !result && result.error().code != ErrorCode::Closed) {
        logger_.warn("Transport close failed: " + result.error().message);
    }
}

// ─────────────────────────────────────────────
// Producer Side
// ─────────────────────────────────────────────

Result<void> AggregationBuffer::submit(Event event) {
    if (!channel_.push(Message{std::in_place_type<Event>, std::move(event)})) {
        return Error{"Buffer closed", ErrorCode::Closed};
    }
    events_submitted_.fetch_add(1, std::memory_order_relaxed);
    return ok();
}

Result<void> AggregationBuffer::flush() {
    auto reply = std::make_shared<std::promise<Result<void>>>();
    if (!channel_.push(Message{FlushRequest{reply}})) {
        return Error{"Buffer closed", ErrorCode::Closed};
    }
    return await_reply(std::move(reply), std::nullopt);
}

Result<void> AggregationBuffer::close() {
    auto reply = std::make_shared<std::promise<Result<void>>>();

    // 1. Enqueue the close request behind everything already submitted.
    if (!channel_.push_and_close(Message{CloseRequest{reply}})) {
        // Closed earlier, possibly by a fault whose flush is still sending.
        if (close_timeout_) {
            if (loop_stopped_future_.wait_for(*close_timeout_) == std::future_status::timeout) {
                return Error{"Timed out after " + std::to_string(close_timeout_->count())
                             + "ms waiting for the processing loop to stop", ErrorCode::Timeout};
            }
        } else {
            loop_stopped_future_.wait();
        }

        std::optional<Error> fault;
        {
            std::lock_guard lock(fault_mutex_);
            fault = fault_;
        }
        if (!fault) {
            return Error{"Buffer already closed", ErrorCode::Closed};
        }
        // The loop stopped on a fault; release the transport and report it.
        auto transport_result = close_transport();
        if (!transport_result && transport_result.error().code != ErrorCode::Closed) {
            return Error{fault->message + "; transport close: "
                         + transport_result.error().message, fault->code};
        }
        return *fault;
    }

    logger_.info("Close requested, draining queue and flushing stats before stopping");

    // 2. Wait for the loop to drain and run its final flush.
    auto flush_result = await_reply(std::move(reply), close_timeout_);
    if (!flush_result && flush_result.error().code == ErrorCode::Timeout) {
        // Loop still owns the transport; the destructor closes it after join.
        return flush_result;
    }

    // 3. Close the transport.
    auto transport_result = close_transport();

    if (!flush_result) {
        if (!transport_result) {
            return Error{flush_result.error().message + "; transport close: "
                         + transport_result.error().message, flush_result.error().code};
        }
        return flush_result;
    }
    return transport_result;
}

Result<void> AggregationBuffer::await_reply(Reply reply,
                                            std::optional<std::chrono::milliseconds> timeout) {
    auto future = reply->get_future();
    reply.reset();

    if (timeout && future.wait_for(*timeout) == std::future_status::timeout) {
        return Error{"Timed out after " + std::to_string(timeout->count())
                     + "ms waiting for the final flush", ErrorCode::Timeout};
    }
    return future.get();
}

Result<void> AggregationBuffer::close_transport() {
    if (transport_closed_.exchange(true)) {
        return Error{"Transport already closed", ErrorCode::Closed};
    }
    return transport_->close();
}

BufferStats AggregationBuffer::stats() const noexcept {
    return BufferStats{
        .events_submitted = events_submitted_.load(std::memory_order_relaxed),
        .events_merged = events_merged_.load(std::memory_order_relaxed),
        .kind_mismatches = kind_mismatches_.load(std::memory_order_relaxed),
        .flushes = flushes_.load(std::memory_order_relaxed),
        .sends = sends_.load(std::memory_order_relaxed),
        .send_failures = send_failures_.load(std::memory_order_relaxed),
    };
}

// ─────────────────────────────────────────────
// Processing Loop
// ─────────────────────────────────────────────

void AggregationBuffer::run() {
    try {
        process_messages();
    } catch (const std::exception& e) {
        handle_fault(e.what());
    } catch (...) {
        handle_fault("non-standard exception");
    }
}

void AggregationBuffer::process_messages() {
    auto next_tick = SteadyClock::now() + flush_interval_;
    Message message;

    while (true) {
        // Checked every iteration so a busy channel cannot starve the tick.
        if (auto now = SteadyClock::now(); now >= next_tick) {
            if (auto result = flush_events(); !result) {
                logger_.debug("Periodic flush finished with errors: " + result.error().message);
            }
            next_tick += flush_interval_;
            now = SteadyClock::now();
            if (next_tick <= now) next_tick = now + flush_interval_;
        }

        auto status = channel_.pop_until(message, next_tick);
        if (status == PopStatus::Timeout) continue;

        if (status == PopStatus::Closed) {
            // Closed without a close request; keep nothing behind.
            state_ = BufferState::Draining;
            if (auto result = flush_events(); !result) {
                logger_.warn("Final flush finished with errors: " + result.error().message);
            }
            mark_stopped();
            return;
        }

        if (auto* event = std::get_if<Event>(&message)) {
            apply(std::move(*event));
        } else if (auto* request = std::get_if<FlushRequest>(&message)) {
            in_flight_ = std::move(request->reply);
            auto result = flush_events();
            std::exchange(in_flight_, nullptr)->set_value(std::move(result));
        } else if (auto* request = std::get_if<CloseRequest>(&message)) {
            logger_.info("Asked to terminate. Flushing stats before returning.");
            state_ = BufferState::Draining;
            in_flight_ = std::move(request->reply);
            auto result = flush_events();
            mark_stopped();
            std::exchange(in_flight_, nullptr)->set_value(std::move(result));
            return;
        }
    }
}

void AggregationBuffer::apply(Event event) {
    auto it = events_.find(key_of(event));
    if (it == events_.end()) {
        MetricKey key = key_of(event);
        events_.emplace(std::move(key), std::move(event));
        return;
    }

    if (auto merged = merge(it->second, event); !merged) {
        kind_mismatches_.fetch_add(1, std::memory_order_relaxed);
        logger_.warn("Dropping event: " + merged.error().message);
        return;
    }
    events_merged_.fetch_add(1, std::memory_order_relaxed);
}

// ─────────────────────────────────────────────
// Flush (loop thread only)
// ─────────────────────────────────────────────

Result<void> AggregationBuffer::flush_events() {
    if (events_.empty()) return ok();

    std::vector<std::future<Result<void>>> pending;
    pending.reserve(events_.size());
    for (auto& [key, event] : events_) {
        pending.push_back(send_pool_.submit(
            [transport = transport_, e = std::move(event)]() -> Result<void> {
                return transport->send(e);
            }));
    }
    events_.clear();

    std::optional<Error> first_error;
    std::exception_ptr fault;
    size_t failures = 0;

    // Every send is awaited before a fault is rethrown.
    for (auto& future : pending) {
        try {
            auto result = future.get();
            if (!result) {
                ++failures;
                logger_.warn("Send failed: " + result.error().message);
                if (!first_error) first_error = result.error();
            }
        } catch (const std::exception& e) {
            ++failures;
            logger_.error(std::string("Send raised: ") + e.what());
            if (!fault) fault = std::current_exception();
        }
    }

    flushes_.fetch_add(1, std::memory_order_relaxed);
    sends_.fetch_add(pending.size(), std::memory_order_relaxed);
    send_failures_.fetch_add(failures, std::memory_order_relaxed);
    logger_.debug("Flushed " + std::to_string(pending.size()) + " events, "
                  + std::to_string(failures) + " failed");

    if (fault) std::rethrow_exception(fault);
    if (first_error) return *first_error;
    return ok();
}

// ─────────────────────────────────────────────
// Fault Handling
// ─────────────────────────────────────────────

void AggregationBuffer::handle_fault(const std::string& what) {
    logger_.error("Caught fault in processing loop (" + what
                  + "), flushing stats before stopping");

    Error fault{"Processing loop fault: " + what, ErrorCode::Fault};
    {
        std::lock_guard lock(fault_mutex_);
        fault_ = fault;
    }

    // No producer can enqueue past this point; they now see ErrorCode::Closed.
    channel_.close();

    std::vector<Reply> waiters;
    if (in_flight_) waiters.push_back(std::exchange(in_flight_, nullptr));

    try {
        for (auto& message : channel_.drain()) {
            if (auto* event = std::get_if<Event>(&message)) {
                apply(std::move(*event));
            } else if (auto* request = std::get_if<FlushRequest>(&message)) {
                waiters.push_back(std::move(request->reply));
            } else if (auto* request = std::get_if<CloseRequest>(&message)) {
                waiters.push_back(std::move(request->reply));
            }
        }
        if (auto result = flush_events(); !result) {
            logger_.warn("Best-effort flush after fault had errors: " + result.error().message);
        }
    } catch (const std::exception& e) {
        logger_.error(std::string("Best-effort flush after fault failed: ") + e.what());
        events_.clear();
    }

    mark_stopped();

    for (auto& waiter : waiters) {
        waiter->set_value(fault);
    }
    // Runs after mark_stopped(), so the handler may call close().
    if (on_fault_) {
        on_fault_(fault);
    }
}

void AggregationBuffer::mark_stopped() {
    state_ = BufferState::Stopped;
    loop_stopped_.set_value();
}

}  // namespace buffered_statsd
