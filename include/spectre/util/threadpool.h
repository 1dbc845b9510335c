// SPECTRE - Thread Pool
// Copyright (c) 2024 SPECTRE Developers
// MIT License
//
// Fixed-size worker pool used to keep long proofs off the threads that
// accept HTTP connections:
// - FIFO queue with a bound on pending tasks
// - Futures for result retrieval (exceptions travel through the future)
// - Graceful shutdown

#ifndef SPECTRE_UTIL_THREADPOOL_H
#define SPECTRE_UTIL_THREADPOOL_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace spectre {
namespace util {

/// Raised when a task cannot be queued
class ThreadPoolError : public std::runtime_error {
public:
    explicit ThreadPoolError(const std::string& msg) : std::runtime_error(msg) {}
};

class ThreadPool {
public:
    struct Config {
        size_t numThreads{0};        // 0 = hardware concurrency
        size_t maxQueueSize{1024};   // Maximum pending tasks
        std::string name{"pool"};    // Pool name for logging
        bool startImmediately{true}; // Start workers on construction
    };

    ThreadPool();
    explicit ThreadPool(size_t numThreads);
    explicit ThreadPool(const Config& config);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void Start();

    /// Block until the queue is empty and no task is running
    void Wait();

    /// Stop accepting work, finish queued tasks and join the workers
    void Shutdown();

    bool IsRunning() const { return running_.load(); }
    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;
    size_t ActiveTasks() const { return activeTasks_.load(); }
    const std::string& GetName() const { return config_.name; }

    // ========================================================================
    // Task Submission
    // ========================================================================

    /**
     * Queue a task and return its future.
     * @throws ThreadPoolError if the pool is stopped or the queue is full
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {
        using ReturnType = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<ReturnType> result = task->get_future();

        Enqueue([task]() { (*task)(); }, true);
        return result;
    }

    /// Queue a fire-and-forget task; exceptions it throws are logged
    template<typename F>
    void Execute(F&& f) {
        Enqueue(std::function<void()>(std::forward<F>(f)), true);
    }

    /// As Execute, but returns false instead of throwing when saturated
    template<typename F>
    bool TryExecute(F&& f) {
        return Enqueue(std::function<void()>(std::forward<F>(f)), false);
    }

private:
    Config config_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable waitCondition_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> activeTasks_{0};

    bool Enqueue(std::function<void()> task, bool throwOnFailure);
    void WorkerLoop();
};

} // namespace util
} // namespace spectre

#endif // SPECTRE_UTIL_THREADPOOL_H
