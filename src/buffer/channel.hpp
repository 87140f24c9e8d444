/**
 * @file channel.hpp
 * @brief Bounded multi-producer / single-consumer FIFO channel.
 * @author Dimitris Kafetzis
 *
 * Producers block while the channel is full. The consumer waits with a
 * deadline so it can multiplex "message arrived" and "timer expired" in a
 * single wait. Closing rejects further pushes but keeps already queued
 * messages available to the consumer.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace buffered_statsd {

enum class PopStatus : uint8_t {
    Message,    ///< A message was dequeued
    Timeout,    ///< Deadline reached with nothing queued
    Closed      ///< Channel closed and fully drained
};

template <typename T>
class Channel {
public:
    explicit Channel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    // Non-copyable
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// Blocks while full. Returns false once the channel is closed.
    bool push(T item) {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) return false;
        queue_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Enqueue a final message and close the channel in one step.
     *
     * Nothing can be enqueued behind @p item, so it is the last message the
     * consumer sees. Returns false if the channel was already closed.
     */
    bool push_and_close(T item) {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) return false;
        queue_.push_back(std::move(item));
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
        return true;
    }

    template <typename Clock, typename Dur>
    PopStatus pop_until(T& out, const std::chrono::time_point<Clock, Dur>& deadline) {
        std::unique_lock lock(mutex_);
        bool ready = not_empty_.wait_until(lock, deadline,
                                           [this] { return closed_ || !queue_.empty(); });
        if (!queue_.empty()) {
            out = std::move(queue_.front());
            queue_.pop_front();
            not_full_.notify_one();
            return PopStatus::Message;
        }
        return ready ? PopStatus::Closed : PopStatus::Timeout;
    }

    void close() {
        std::lock_guard lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    /// Remove and return everything currently queued.
    std::vector<T> drain() {
        std::lock_guard lock(mutex_);
        std::vector<T> items;
        items.reserve(queue_.size());
        while (!queue_.empty()) {
            items.push_back(std::move(queue_.front()));
            queue_.pop_front();
        }
        not_full_.notify_all();
        return items;
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    size_t capacity_;
    bool closed_ = false;
};

}  // namespace buffered_statsd
