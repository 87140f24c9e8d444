/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/thread_pool.hpp"

#include <pthread.h>

#include <algorithm>

namespace buffered_statsd {

ThreadPool::ThreadPool(size_t num_threads, std::string name) : name_(std::move(name)) {
    if (num_threads == 0) {
        num_threads = std::max(1u, std::thread::hardware_concurrency());
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this, i](std::stop_token stop) { run_worker(stop, i); });
    }
}

ThreadPool::~ThreadPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    wake_.notify_all();
    workers_.clear();  // joins; each worker exits only once pending_ is empty
}

void ThreadPool::enqueue(Task task) {
    {
        std::lock_guard lock(mutex_);
        pending_.push_back(std::move(task));
    }
    wake_.notify_one();
}

std::optional<ThreadPool::Task> ThreadPool::next_task(const std::stop_token& stop) {
    std::unique_lock lock(mutex_);
    wake_.wait(lock, stop, [this] { return !pending_.empty(); });
    if (pending_.empty()) {
        return std::nullopt;  // woken by the stop request with nothing left
    }
    Task task = std::move(pending_.front());
    pending_.pop_front();
    return task;
}

void ThreadPool::run_worker(std::stop_token stop, size_t index) {
    // Linux limits thread names to 15 characters.
    auto thread_name = (name_ + "-" + std::to_string(index)).substr(0, 15);
    pthread_setname_np(pthread_self(), thread_name.c_str());

    while (auto task = next_task(stop)) {
        active_.fetch_add(1, std::memory_order_relaxed);
        (*task)();
        active_.fetch_sub(1, std::memory_order_relaxed);
        completed_.fetch_add(1, std::memory_order_relaxed);
    }
}

size_t ThreadPool::queued_count() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

}  // namespace buffered_statsd
