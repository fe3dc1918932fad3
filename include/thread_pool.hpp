/**
 * @file thread_pool.hpp
 * @brief Worker pool for replica copies and background tier moves
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef TIERGUARD_THREAD_POOL_HPP
#define TIERGUARD_THREAD_POOL_HPP

#include "result.hpp"
#include "tg_logger.hpp"
#include <algorithm>
#include <string>
#include <vector>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <atomic>
#include <memory>
#include <stdexcept>

namespace tierguard {

struct ThreadPoolStatistics {
    size_t threads = 0;
    size_t queued = 0;
    size_t active = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;        ///< Posted jobs that threw
};

/**
 * @class ThreadPool
 * @brief Fixed set of workers draining one FIFO queue
 *
 * With a single worker, jobs run in the order they were queued. waitAll()
 * returns once the queue is empty and no job is running; jobs queued by
 * running jobs are waited for too.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t n = 0, std::string name = "workers") : name_(std::move(name)) {
        if (n == 0) n = std::max<size_t>(1, std::thread::hardware_concurrency());
        workers_.reserve(n);
        for (size_t i = 0; i < n; ++i) workers_.emplace_back([this] { workerLoop(); });
        LOG_DEBUG("ThreadPool", name_ + " started with " + std::to_string(n) + " workers");
    }
    ~ThreadPool() { shutdown(); }
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a call whose result or exception the caller collects
     * @throws std::runtime_error once the pool is stopped
     */
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using R = std::invoke_result_t<F, Args...>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<R> result = task->get_future();
        if (!enqueue([task] { (*task)(); })) throw std::runtime_error(name_ + " pool stopped");
        return result;
    }

    /// Fire-and-forget job; an exception it throws is logged and counted
    Result<void> post(std::function<void()> fn) {
        if (!fn) return Err(ErrorCode::INVALID_ARGUMENT, "empty job");
        auto job = [this, fn = std::move(fn)] {
            try {
                fn();
            } catch (const std::exception& e) {
                ++failed_;
                LOG_ERROR("ThreadPool", name_ + " job failed: " + e.what());
            }
        };
        if (!enqueue(std::move(job))) return Err(ErrorCode::INVALID_STATE, name_ + " pool stopped");
        return Ok();
    }

    void waitAll() {
        std::unique_lock<std::mutex> lock(mtx_);
        idle_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
    }

    /// Stop accepting work; with @p drain, finish what is queued first
    void shutdown(bool drain = true) {
        {
            std::unique_lock<std::mutex> lock(mtx_);
            if (stopping_ && workers_.empty()) return;
            if (drain) idle_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
            else queue_.clear();
            stopping_ = true;
        }
        wake_.notify_all();
        for (auto& w : workers_) if (w.joinable()) w.join();
        workers_.clear();
        LOG_DEBUG("ThreadPool", name_ + " stopped after " + std::to_string(completed_.load()) + " jobs");
    }

    [[nodiscard]] bool isStopped() const { std::lock_guard<std::mutex> lock(mtx_); return stopping_; }

    [[nodiscard]] ThreadPoolStatistics statistics() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return ThreadPoolStatistics{workers_.size(), queue_.size(), active_, completed_.load(), failed_.load()};
    }

private:
    bool enqueue(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (stopping_) return false;
            queue_.push_back(std::move(job));
        }
        wake_.notify_one();
        return true;
    }

    void workerLoop() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mtx_);
                wake_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (queue_.empty()) return;
                job = std::move(queue_.front());
                queue_.pop_front();
                ++active_;
            }
            job();
            ++completed_;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                --active_;
                if (queue_.empty() && active_ == 0) idle_.notify_all();
            }
        }
    }

    std::string name_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mtx_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    bool stopping_ = false;
    size_t active_ = 0;
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace tierguard
#endif // TIERGUARD_THREAD_POOL_HPP
