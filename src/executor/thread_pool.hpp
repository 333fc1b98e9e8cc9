/**
 * @file thread_pool.hpp
 * @brief std::jthread-based bounded worker pool with completion callbacks.
 * @author AnalyzerOrchestrator Team
 *
 * Generation, analysis and subtask dispatch each run on their own pool so a
 * slow stage never starves another. Callbacks passed to submit() run on the
 * worker thread right after the job, which is how the scheduler updates its
 * counters exactly once per job.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace analyzer_orchestrator {

/**
 * @brief Thread pool using std::jthread for automatic join and stop_token support.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0, std::string name = "pool");
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution. Throws std::runtime_error after shutdown().
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /**
     * @brief Submit a callable whose result is handed to a continuation.
     *
     * The continuation runs on the worker thread before the returned future
     * becomes ready.
     */
    template <std::invocable F, typename C>
        requires std::invocable<C, std::invoke_result_t<F>&>
    std::future<std::invoke_result_t<F>> submit(F&& func, C&& on_complete);

    /// Submit a callable that accepts a stop_token.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit_cancellable(F&& func);

    /// Stop accepting work. Queued jobs still run.
    void shutdown() noexcept;

    /// Block until no job is queued or running, or the timeout expires.
    bool wait_idle(std::chrono::milliseconds timeout);

    [[nodiscard]] bool accepting() const noexcept;
    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void worker_loop(std::stop_token stop);
    void enqueue(std::function<void(std::stop_token)> task);

    std::string name_;
    std::vector<std::jthread> workers_;
    std::queue<std::function<void(std::stop_token)>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable_any idle_cv_;
    std::atomic<size_t> active_tasks_{0};
    std::atomic<bool> accepting_{true};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(func)](std::stop_token) mutable {
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
    return future;
}

template <std::invocable F, typename C>
    requires std::invocable<C, std::invoke_result_t<F>&>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func, C&& on_complete) {
    using ReturnType = std::invoke_result_t<F>;
    static_assert(!std::is_void_v<ReturnType>, "continuations need a result to observe");
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(func),
             c = std::forward<C>(on_complete)](std::stop_token) mutable {
        try {
            auto result = f();
            c(result);
            p->set_value(std::move(result));
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    return future;
}

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> ThreadPool::submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(func)](std::stop_token stop) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f(stop);
                p->set_value();
            } else {
                p->set_value(f(stop));
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    return future;
}

}  // namespace analyzer_orchestrator
