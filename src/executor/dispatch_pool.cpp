/**
 * @file dispatch_pool.cpp
 * @brief DispatchPool implementation.
 */

#include "executor/dispatch_pool.hpp"

namespace hybrid_orchestrator {

DispatchPool::DispatchPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

DispatchPool::~DispatchPool() {
    shutdown();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    // Join while the queue and its mutex are still alive; workers drain first
    workers_.clear();
}

bool DispatchPool::post(std::function<void(std::stop_token)> task) {
    {
        std::lock_guard lock(queue_mutex_);
        if (closed_) return false;
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

void DispatchPool::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        closed_ = true;
    }
    queue_cv_.notify_all();
}

void DispatchPool::worker_loop(std::stop_token stop) {
    for (;;) {
        std::function<void(std::stop_token)> task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty() || closed_; });

            if (task_queue_.empty()) {
                if (closed_ || stop.stop_requested()) return;
                continue;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        ++active_tasks_;
        task(stop);
        --active_tasks_;
    }
}

size_t DispatchPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t DispatchPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t DispatchPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace hybrid_orchestrator
