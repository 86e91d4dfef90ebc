//
// Created by Giuseppe Francione on 18/09/25.
//

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used by ProcessorExecutor.
 */

#ifndef PIXTRIM_THREAD_POOL_HPP
#define PIXTRIM_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

namespace pixtrim {

/**
 * @brief A fixed-size pool of std::jthread workers.
 *
 * @details Tasks take a `std::stop_token` tied to the pool's cancellation
 * source. request_stop() closes the pool to new work and raises the token,
 * but tasks already queued still run: each is expected to notice the token
 * and finish quickly, so every submitted task runs exactly once.
 * wait_idle() is the join barrier for a batch.
 */
class ThreadPool {
public:
    /**
     * @param threads Number of workers; 0 means one per hardware thread.
     */
    explicit ThreadPool(unsigned threads = 0);

    /// Drains the queue, then joins all workers.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a callable taking a `std::stop_token`.
     * @return A future for the task's result.
     * @throws std::runtime_error if the pool has been stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        auto future = task->get_future();
        {
            std::unique_lock lock(queue_mutex_);
            if (closed_) throw std::runtime_error("enqueue on stopped ThreadPool");
            ++pending_;
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        condition_.notify_one();
        return future;
    }

    /// Blocks until every queued and running task has finished.
    void wait_idle();

    /**
     * @brief Refuse new tasks and raise the stop token of queued and running ones.
     *
     * Queued tasks are not discarded; they run and observe the token.
     */
    void request_stop();

    [[nodiscard]] bool stop_requested() const noexcept { return stop_source_.stop_requested(); }

    [[nodiscard]] unsigned size() const noexcept { return static_cast<unsigned>(workers_.size()); }

private:
    std::mutex queue_mutex_;                ///< Protects tasks_, closed_, shutdown_ and pending_
    std::condition_variable_any condition_; ///< New task or shutdown
    std::condition_variable idle_cv_;       ///< pending_ reached zero
    std::queue<std::function<void(std::stop_token)>> tasks_;
    std::stop_source stop_source_;          ///< Cancellation seen by tasks
    bool closed_{false};                    ///< No more enqueues
    bool shutdown_{false};                  ///< Workers exit once the queue is empty
    std::size_t pending_{0};                ///< Queued plus running tasks
    std::vector<std::jthread> workers_;     ///< Last member: joined before the rest is destroyed
};

} // namespace pixtrim

#endif // PIXTRIM_THREAD_POOL_HPP
