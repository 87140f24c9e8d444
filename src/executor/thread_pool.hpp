/**
 * @file thread_pool.hpp
 * @brief std::jthread-based worker pool that runs flush sends concurrently.
 * @author Dimitris Kafetzis
 *
 * Stopping the pool never discards accepted work: the destructor lets the
 * workers run every queued task before joining, so a send handed over during
 * the final flush always reaches the transport.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace buffered_statsd {

class ThreadPool {
public:
    /// @param num_threads 0 = hardware_concurrency
    /// @param name        worker thread name prefix (shown by top -H / gdb)
    explicit ThreadPool(size_t num_threads = 0, std::string name = "bs-send");
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue a callable. Its result, or the exception it throws, arrives through the future.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    [[nodiscard]] size_t active_count() const noexcept { return active_.load(); }
    [[nodiscard]] uint64_t completed_count() const noexcept { return completed_.load(); }
    [[nodiscard]] size_t queued_count() const;
    [[nodiscard]] size_t thread_count() const noexcept { return workers_.size(); }

private:
    using Task = std::function<void()>;

    void enqueue(Task task);
    void run_worker(std::stop_token stop, size_t index);

    /// Blocks for the next task; nullopt once stop was requested and the queue is empty.
    std::optional<Task> next_task(const std::stop_token& stop);

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable_any wake_;
    std::deque<Task> pending_;
    std::atomic<size_t> active_{0};
    std::atomic<uint64_t> completed_{0};

    // Last member: workers start once everything above exists.
    std::vector<std::jthread> workers_;
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using R = std::invoke_result_t<F>;
    // std::function needs a copyable target; packaged_task is move-only.
    auto job = std::make_shared<std::packaged_task<R()>>(std::forward<F>(func));
    auto result = job->get_future();
    enqueue([job = std::move(job)] { (*job)(); });
    return result;
}

}  // namespace buffered_statsd
