// CHIEFTALLY - Thread Pool
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License
//
// Bounded worker pool for the fan-out phases of the tally. A pool is
// scoped to one phase: the owner constructs it, maps the phase's work
// over it, and destroys it (joining every worker) before moving on.

#ifndef CHIEFTALLY_UTIL_THREADPOOL_H
#define CHIEFTALLY_UTIL_THREADPOOL_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace chieftally {
namespace util {

// ============================================================================
// Thread Pool
// ============================================================================

class ThreadPool {
public:
    struct Config {
        size_t numThreads{10};       // 0 = hardware concurrency
        size_t maxQueueSize{100000}; // Submit throws beyond this
        std::string name{"pool"};
    };

    explicit ThreadPool(size_t numThreads);
    explicit ThreadPool(const Config& config);

    /// Runs pending tasks, then joins workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Drain the queue and join all workers. Idempotent.
    void Shutdown();

    bool IsRunning() const { return running_.load(); }
    size_t ThreadCount() const { return workers_.size(); }
    const std::string& Name() const { return config_.name; }

    /**
     * Queue a callable. Exceptions it throws are stored in the returned
     * future. Throws std::runtime_error if the pool is shut down or the
     * queue is full.
     */
    template<typename F>
    auto Submit(F&& f) -> std::future<typename std::invoke_result<F>::type> {
        using ReturnType = typename std::invoke_result<F>::type;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_.load()) {
                throw std::runtime_error("ThreadPool " + config_.name + " not running");
            }
            if (tasks_.size() >= config_.maxQueueSize) {
                throw std::runtime_error("ThreadPool " + config_.name + " queue full");
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        condition_.notify_one();
        return result;
    }

private:
    Config config_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    std::mutex queueMutex_;
    std::condition_variable condition_;
    std::atomic<bool> running_{false};

    void Start();
    void WorkerLoop();
};

// ============================================================================
// Parallel Algorithms
// ============================================================================

/**
 * Wait for every future, then surface the first stored exception.
 * No future is abandoned while its task may still reference caller state.
 */
template<typename T>
std::vector<T> WaitAll(std::vector<std::future<T>>& futures) {
    for (auto& f : futures) {
        f.wait();
    }
    std::vector<T> results;
    results.reserve(futures.size());
    for (auto& f : futures) {
        results.push_back(f.get());
    }
    return results;
}

/**
 * Map a function over items on the pool. Result i corresponds to
 * items[i]. Every submitted task finishes before this returns or
 * rethrows, including when a Submit fails partway through.
 */
template<typename T, typename Func>
auto ParallelMap(ThreadPool& pool, const std::vector<T>& items, Func func)
    -> std::vector<typename std::invoke_result<Func, const T&>::type> {
    using ResultType = typename std::invoke_result<Func, const T&>::type;

    std::vector<std::future<ResultType>> futures;
    futures.reserve(items.size());
    try {
        for (const auto& item : items) {
            futures.push_back(pool.Submit([&func, &item]() { return func(item); }));
        }
    } catch (...) {
        for (auto& f : futures) {
            f.wait();
        }
        throw;
    }
    return WaitAll(futures);
}

} // namespace util
} // namespace chieftally

#endif // CHIEFTALLY_UTIL_THREADPOOL_H
