// KEYSEAL - Thread Pool Implementation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include "keyseal/util/threadpool.h"
#include "keyseal/util/logging.h"

#include <algorithm>
#include <stdexcept>

namespace keyseal {
namespace util {

ThreadPool::ThreadPool() : ThreadPool(Config{}) {}

ThreadPool::ThreadPool(size_t numThreads) : config_() {
    config_.numThreads = numThreads;
    Start();
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
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;

    size_t count = config_.numThreads;
    if (count == 0) {
        count = std::max(2u, std::thread::hardware_concurrency());
    }
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this]() { WorkerLoop(); });
    }

    LOG_DEBUG(LogCategory::DEFAULT) << "thread pool '" << config_.name << "' started, "
                                    << count << " workers";
}

void ThreadPool::Enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            throw std::runtime_error("thread pool '" + config_.name + "' is not running");
        }
        if (jobs_.size() >= config_.maxQueueSize) {
            throw std::runtime_error("thread pool '" + config_.name + "' queue is full");
        }
        jobs_.push(std::move(job));
    }
    workAvailable_.notify_one();
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this]() { return jobs_.empty() && active_ == 0; });
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    workAvailable_.notify_all();

    for (auto& worker : workers_) {
        worker.join();
    }
    workers_.clear();
}

bool ThreadPool::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

size_t ThreadPool::ActiveTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void ThreadPool::WorkerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        workAvailable_.wait(lock, [this]() { return !running_ || !jobs_.empty(); });
        if (jobs_.empty()) {
            return;  // stopped and drained
        }

        std::function<void()> job = std::move(jobs_.front());
        jobs_.pop();
        ++active_;

        lock.unlock();
        job();  // packaged_task: exceptions land in the future
        lock.lock();

        --active_;
        if (jobs_.empty() && active_ == 0) {
            idle_.notify_all();
        }
    }
}

// ============================================================================
// Global Pool
// ============================================================================

namespace {

std::mutex g_globalMutex;
std::unique_ptr<ThreadPool> g_globalPool;

} // anonymous namespace

ThreadPool& GetGlobalThreadPool() {
    std::lock_guard<std::mutex> lock(g_globalMutex);
    if (!g_globalPool) {
        ThreadPool::Config config;
        config.name = "global";
        g_globalPool = std::make_unique<ThreadPool>(config);
    }
    return *g_globalPool;
}

void InitGlobalThreadPool(const ThreadPool::Config& config) {
    std::lock_guard<std::mutex> lock(g_globalMutex);
    g_globalPool.reset();
    g_globalPool = std::make_unique<ThreadPool>(config);
}

void ShutdownGlobalThreadPool() {
    std::lock_guard<std::mutex> lock(g_globalMutex);
    g_globalPool.reset();
}

} // namespace util
} // namespace keyseal
