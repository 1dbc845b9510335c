// SPECTRE - Thread Pool Tests
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include <gtest/gtest.h>

#include "spectre/util/threadpool.h"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

namespace spectre {
namespace util {
namespace test {

// ============================================================================
// Submission
// ============================================================================

TEST(ThreadPoolTest, SubmitReturnsFuture) {
    ThreadPool pool(2);
    EXPECT_TRUE(pool.IsRunning());
    EXPECT_EQ(pool.ThreadCount(), 2u);

    auto sum = pool.Submit([](int a, int b) { return a + b; }, 20, 22);
    auto text = pool.Submit([]() { return std::string("proof"); });
    EXPECT_EQ(sum.get(), 42);
    EXPECT_EQ(text.get(), "proof");
}

TEST(ThreadPoolTest, ExceptionTravelsThroughFuture) {
    ThreadPool pool(1);
    auto failing = pool.Submit([]() -> int { throw std::runtime_error("witness failed"); });
    try {
        failing.get();
        FAIL() << "expected an exception";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "witness failed");
    }

    // The worker survives the failure
    EXPECT_EQ(pool.Submit([]() { return 1; }).get(), 1);
}

TEST(ThreadPoolTest, ManyTasks) {
    ThreadPool pool(4);
    std::vector<std::future<int>> results;
    for (int i = 0; i < 100; ++i) {
        results.push_back(pool.Submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ExecuteAndWait) {
    ThreadPool pool(3);
    std::atomic<int> counter{0};
    for (int i = 0; i < 50; ++i) {
        pool.Execute([&counter]() { counter.fetch_add(1); });
    }
    pool.Wait();
    EXPECT_EQ(counter.load(), 50);
    EXPECT_EQ(pool.PendingTasks(), 0u);
    EXPECT_EQ(pool.ActiveTasks(), 0u);
}

TEST(ThreadPoolTest, ExecuteSurvivesThrowingTask) {
    ThreadPool pool(1);
    std::atomic<bool> ran{false};
    pool.Execute([]() { throw std::runtime_error("ignored"); });
    pool.Execute([&ran]() { ran.store(true); });
    pool.Wait();
    EXPECT_TRUE(ran.load());
}

// ============================================================================
// Saturation and Shutdown
// ============================================================================

TEST(ThreadPoolTest, TryExecuteWhenQueueFull) {
    ThreadPool::Config config;
    config.numThreads = 1;
    config.maxQueueSize = 1;
    config.name = "prover";
    ThreadPool pool(config);

    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    pool.Execute([&started, gate]() {
        started.set_value();
        gate.wait();
    });
    started.get_future().wait();

    EXPECT_TRUE(pool.TryExecute([]() {}));
    EXPECT_FALSE(pool.TryExecute([]() {}));
    EXPECT_THROW(pool.Submit([]() { return 0; }), ThreadPoolError);

    release.set_value();
    pool.Wait();
    EXPECT_TRUE(pool.TryExecute([]() {}));
}

TEST(ThreadPoolTest, NotStartedRejectsWork) {
    ThreadPool::Config config;
    config.numThreads = 1;
    config.startImmediately = false;
    ThreadPool pool(config);

    EXPECT_FALSE(pool.IsRunning());
    EXPECT_FALSE(pool.TryExecute([]() {}));

    pool.Start();
    EXPECT_EQ(pool.Submit([]() { return 5; }).get(), 5);
}

TEST(ThreadPoolTest, ShutdownDrainsQueue) {
    std::atomic<int> counter{0};
    ThreadPool pool(1);
    for (int i = 0; i < 20; ++i) {
        pool.Execute([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            counter.fetch_add(1);
        });
    }
    pool.Shutdown();
    EXPECT_EQ(counter.load(), 20);
    EXPECT_FALSE(pool.IsRunning());
    EXPECT_EQ(pool.ThreadCount(), 0u);
}

TEST(ThreadPoolTest, SubmitAfterShutdownThrows) {
    ThreadPool pool(1);
    pool.Shutdown();
    EXPECT_THROW(pool.Submit([]() { return 1; }), ThreadPoolError);
    EXPECT_THROW(pool.Execute([]() {}), ThreadPoolError);
    EXPECT_FALSE(pool.TryExecute([]() {}));

    // Second shutdown is harmless
    pool.Shutdown();
}

} // namespace test
} // namespace util
} // namespace spectre
