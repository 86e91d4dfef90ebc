//
// Created by Giuseppe Francione on 19/09/25.
//

#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

namespace pixtrim {

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& worker_st) {
            for (;;) {
                std::function<void(std::stop_token)> task;
                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, worker_st, [this] {
                        return shutdown_ || !tasks_.empty();
                    });
                    if (tasks_.empty()) {
                        if (shutdown_ || worker_st.stop_requested()) return;
                        continue;
                    }
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                struct PendingGuard {
                    std::size_t &pending;
                    std::mutex &mtx;
                    std::condition_variable &cv;
                    ~PendingGuard() {
                        std::lock_guard lock(mtx);
                        if (pending > 0) --pending;
                        cv.notify_all();
                    }
                } guard{pending_, queue_mutex_, idle_cv_};
                try {
                    task(stop_source_.get_token());
                } catch (const std::exception& e) {
                    Logger::log(LogLevel::Error, std::string("Unhandled exception in thread pool: ") + e.what(),
                                "thread_pool");
                }
            }
        });
    }
}

void ThreadPool::request_stop() {
    {
        std::lock_guard lock(queue_mutex_);
        closed_ = true;
    }
    stop_source_.request_stop();
    condition_.notify_all();
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return pending_ == 0 && tasks_.empty();
    });
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        closed_ = true;
        shutdown_ = true;
    }
    condition_.notify_all();
}

} // namespace pixtrim
