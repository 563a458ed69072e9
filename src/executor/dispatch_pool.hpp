/**
 * @file dispatch_pool.hpp
 * @brief std::jthread-based worker pool that runs stage attempts.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace hybrid_orchestrator {

/**
 * @brief Fixed-size pool of jthread workers.
 *
 * Tasks receive the worker's stop token. Destruction stops accepting new
 * work, lets the workers drain everything already queued, then joins.
 */
class DispatchPool {
public:
    explicit DispatchPool(size_t num_threads = 0);
    ~DispatchPool();

    DispatchPool(const DispatchPool&) = delete;
    DispatchPool& operator=(const DispatchPool&) = delete;

    /// Enqueue a fire-and-forget task. Returns false once shutdown began.
    bool post(std::function<void(std::stop_token)> task);

    /// Enqueue a callable and obtain its result through a future.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Stop accepting tasks and wake idle workers; queued tasks still run.
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void(std::stop_token)>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
    bool closed_ = false;
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> DispatchPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    bool accepted = post([p = promise, f = std::forward<F>(func)](std::stop_token) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f();
                p->set_value();
            } else {
                p->set_value(f());
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });

    if (!accepted) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("dispatch pool is shut down")));
    }
    return future;
}

}  // namespace hybrid_orchestrator
