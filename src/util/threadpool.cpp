// CHIEFTALLY - Thread Pool Implementation
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include "chieftally/util/threadpool.h"

#include <algorithm>

namespace chieftally {
namespace util {

ThreadPool::ThreadPool(size_t numThreads) : ThreadPool(Config{numThreads, 100000, "pool"}) {}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    Start();
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Start() {
    size_t count = config_.numThreads;
    if (count == 0) {
        count = std::max(2u, std::thread::hardware_concurrency());
    }
    running_.store(true);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
    workers_.clear();
}

void ThreadPool::WorkerLoop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] { return !running_.load() || !tasks_.empty(); });
            // Drain before exiting
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

} // namespace util
} // namespace chieftally
