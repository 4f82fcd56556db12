// CHIEFTALLY - Util Module Tests
// Copyright (c) 2024 CHIEFTALLY Developers
// MIT License

#include <gtest/gtest.h>

#include <chieftally/util/logging.h>
#include <chieftally/util/threadpool.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <future>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <unistd.h>

namespace chieftally {
namespace util {
namespace test {

// ============================================================================
// Logging Tests
// ============================================================================

/// Keeps every entry at or above its level
class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(LogLevel level = LogLevel::Trace) : level_(level) {}

    void Write(const LogEntry& entry) override {
        if (entry.level < level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        entries.push_back(entry);
    }
    void Flush() override {}
    LogLevel GetLevel() const override { return level_; }

    std::vector<LogEntry> entries;

private:
    LogLevel level_;
    std::mutex mutex_;
};

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    std::shared_ptr<CaptureSink> Capture(LogLevel level = LogLevel::Trace) {
        auto sink = std::make_shared<CaptureSink>(level);
        Logger::Instance().AddSink(sink);
        return sink;
    }
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
}

TEST_F(LoggingTest, NoSinksByDefault) {
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);
    // Nothing to write to, nothing to crash
    LOG_INFO(LogCategory::CHIEF) << "got chief";
}

TEST_F(LoggingTest, LevelFiltering) {
    auto sink = Capture();

    LOG_DEBUG(LogCategory::VOTERS) << "hidden";
    LOG_INFO(LogCategory::VOTERS) << "got voters";
    LOG_WARN(LogCategory::SLATES) << "slate " << 3 << " empty";

    ASSERT_EQ(sink->entries.size(), 2u);
    EXPECT_EQ(sink->entries[0].message, "got voters");
    EXPECT_EQ(sink->entries[0].category, LogCategory::VOTERS);
    EXPECT_EQ(sink->entries[1].level, LogLevel::Warn);
    EXPECT_EQ(sink->entries[1].message, "slate 3 empty");
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Debug));
}

TEST_F(LoggingTest, SinkLevel) {
    auto sink = Capture(LogLevel::Warn);
    LOG_INFO(LogCategory::TALLY) << "got results";
    LOG_ERROR(LogCategory::TALLY) << "failed";
    ASSERT_EQ(sink->entries.size(), 1u);
    EXPECT_EQ(sink->entries[0].message, "failed");
}

TEST_F(LoggingTest, EntryCarriesSourceLocation) {
    auto sink = Capture();
    LOG_WARN(LogCategory::RPC) << "retrying";
    ASSERT_EQ(sink->entries.size(), 1u);
    EXPECT_NE(sink->entries[0].file.find("test_util.cpp"), std::string::npos);
    EXPECT_GT(sink->entries[0].line, 0);
    EXPECT_EQ(sink->entries[0].threadId, std::this_thread::get_id());
}

TEST_F(LoggingTest, TimerLogsAtDebug) {
    auto sink = Capture();
    Logger::Instance().SetLevel(LogLevel::Debug);
    {
        CHIEFTALLY_LOG_TIMER(LogCategory::BENCH, "tally");
    }
    ASSERT_EQ(sink->entries.size(), 2u);
    EXPECT_EQ(sink->entries[0].message, "Starting: tally");
    EXPECT_EQ(sink->entries[1].message.rfind("Completed: tally in ", 0), 0u);
}

TEST_F(LoggingTest, TimerSilentAtInfo) {
    auto sink = Capture();
    {
        CHIEFTALLY_LOG_TIMER(LogCategory::BENCH, "tally");
    }
    EXPECT_TRUE(sink->entries.empty());
}

TEST_F(LoggingTest, FileSink) {
    std::string path = "/tmp/chieftally_log_test_" + std::to_string(::getpid()) + ".log";
    {
        auto sink = std::make_shared<FileSink>(path);
        ASSERT_TRUE(sink->IsOpen());
        Logger::Instance().AddSink(sink);
        LOG_INFO(LogCategory::SPELL) << "got spells";
        Logger::Instance().Flush();
        Logger::Instance().ClearSinks();
    }
    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("[INFO] [spell]"), std::string::npos);
    EXPECT_NE(contents.find("test_util.cpp:"), std::string::npos);
    EXPECT_NE(contents.find("got spells"), std::string::npos);
    std::remove(path.c_str());
}

// ============================================================================
// ThreadPool Tests
// ============================================================================

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = std::make_unique<ThreadPool>(4);
    }

    void TearDown() override {
        pool_.reset();
    }

    std::unique_ptr<ThreadPool> pool_;
};

TEST_F(ThreadPoolTest, Construction) {
    EXPECT_TRUE(pool_->IsRunning());
    EXPECT_EQ(pool_->ThreadCount(), 4u);
}

TEST_F(ThreadPoolTest, ConfiguredPool) {
    ThreadPool pool(ThreadPool::Config{3, 100, "slates"});
    EXPECT_EQ(pool.ThreadCount(), 3u);
    EXPECT_EQ(pool.Name(), "slates");
}

TEST_F(ThreadPoolTest, SubmitAndWait) {
    std::atomic<int> counter{0};
    auto future = pool_->Submit([&counter]() {
        counter++;
        return 42;
    });
    EXPECT_EQ(future.get(), 42);
    EXPECT_EQ(counter.load(), 1);
}

TEST_F(ThreadPoolTest, ExceptionInFuture) {
    auto future = pool_->Submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(ThreadPoolTest, SubmitAfterShutdown) {
    pool_->Shutdown();
    EXPECT_FALSE(pool_->IsRunning());
    EXPECT_THROW(pool_->Submit([]() {}), std::runtime_error);
}

TEST_F(ThreadPoolTest, ShutdownDrainsQueue) {
    std::atomic<int> completed{0};
    for (int i = 0; i < 20; ++i) {
        pool_->Submit([&completed]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            completed++;
        });
    }
    pool_->Shutdown();
    EXPECT_EQ(completed.load(), 20);
}

TEST_F(ThreadPoolTest, ParallelMapKeepsOrder) {
    std::vector<int> items;
    for (int i = 0; i < 50; ++i) items.push_back(i);

    auto results = ParallelMap(*pool_, items, [](const int& x) {
        std::this_thread::sleep_for(std::chrono::microseconds((50 - x) * 10));
        return x * x;
    });
    ASSERT_EQ(results.size(), items.size());
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(results[i], i * i);
    }
}

TEST_F(ThreadPoolTest, ParallelMapBoundedConcurrency) {
    ThreadPool pool(ThreadPool::Config{2, 1000, "bounded"});
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::vector<int> items(16, 0);

    ParallelMap(pool, items, [&](const int&) {
        int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        --active;
        return 0;
    });
    EXPECT_LE(peak.load(), 2);
}

TEST_F(ThreadPoolTest, WaitAll) {
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(pool_->Submit([i]() { return i * 2; }));
    }
    auto results = WaitAll(futures);
    ASSERT_EQ(results.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(results[i], i * 2);
    }
}

TEST_F(ThreadPoolTest, WaitAllFinishesEveryTaskBeforeRethrow) {
    std::atomic<int> finished{0};
    std::vector<std::future<int>> futures;
    futures.push_back(pool_->Submit([]() -> int { throw std::runtime_error("first"); }));
    for (int i = 0; i < 8; ++i) {
        futures.push_back(pool_->Submit([&finished]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            return ++finished;
        }));
    }
    EXPECT_THROW(WaitAll(futures), std::runtime_error);
    EXPECT_EQ(finished.load(), 8);
}

TEST_F(ThreadPoolTest, ParallelMapQueueFullWaitsForSubmitted) {
    // One worker blocked on the gate and a one-slot queue: the third
    // submission at the latest overflows
    ThreadPool pool(ThreadPool::Config{1, 1, "tiny"});
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::atomic<int> finished{0};
    std::thread opener([&gate]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        gate.set_value();
    });

    std::vector<int> items(10, 0);
    EXPECT_THROW(ParallelMap(pool, items, [&](const int&) {
        opened.wait();
        return ++finished;
    }), std::runtime_error);

    int atRethrow = finished.load();
    opener.join();
    pool.Shutdown();
    EXPECT_GE(atRethrow, 1);
    EXPECT_LE(atRethrow, 2);
    EXPECT_EQ(finished.load(), atRethrow);
}

} // namespace test
} // namespace util
} // namespace chieftally
