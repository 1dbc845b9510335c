// SPECTRE - Thread Pool Implementation
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/util/threadpool.h"
#include "spectre/util/logging.h"

namespace spectre {
namespace util {

ThreadPool::ThreadPool() : ThreadPool(Config{}) {}

ThreadPool::ThreadPool(size_t numThreads) {
    config_.numThreads = numThreads;
    if (config_.startImmediately) {
        Start();
    }
}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    if (config_.startImmediately) {
        Start();
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Start() {
    if (running_.exchange(true)) {
        return;
    }

    size_t numThreads = config_.numThreads;
    if (numThreads == 0) {
        numThreads = std::thread::hardware_concurrency();
        if (numThreads == 0) {
            numThreads = 2;
        }
    }

    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }
    LOG_DEBUG(LogCategory::DEFAULT) << "Thread pool '" << config_.name << "' started with "
                                    << numThreads << " workers";
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    waitCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_.load() == 0;
    });
}

void ThreadPool::Shutdown() {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
    }

    condition_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

size_t ThreadPool::PendingTasks() const {
    std::unique_lock<std::mutex> lock(queueMutex_);
    return tasks_.size();
}

bool ThreadPool::Enqueue(std::function<void()> task, bool throwOnFailure) {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (!running_.load()) {
            if (throwOnFailure) throw ThreadPoolError("ThreadPool '" + config_.name + "' not running");
            return false;
        }
        if (tasks_.size() >= config_.maxQueueSize) {
            if (throwOnFailure) throw ThreadPoolError("ThreadPool '" + config_.name + "' queue full");
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    condition_.notify_one();
    return true;
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !running_.load() || !tasks_.empty();
            });

            // Drain what was queued before shutdown
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
            activeTasks_.fetch_add(1);
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(LogCategory::DEFAULT) << "Task in pool '" << config_.name
                                            << "' failed: " << e.what();
        }

        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            activeTasks_.fetch_sub(1);
        }
        waitCondition_.notify_all();
    }
}

} // namespace util
} // namespace spectre
