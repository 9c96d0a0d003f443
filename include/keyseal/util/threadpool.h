// KEYSEAL - Thread Pool
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// Fixed set of workers that run key derivations off the caller's thread.
// Results and exceptions come back through std::future; Shutdown lets
// already queued work finish before joining.

#ifndef KEYSEAL_UTIL_THREADPOOL_H
#define KEYSEAL_UTIL_THREADPOOL_H

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace keyseal {
namespace util {

class ThreadPool {
public:
    struct Config {
        size_t numThreads{0};        // 0 = hardware concurrency
        size_t maxQueueSize{1024};   // Submit throws beyond this many pending jobs
        std::string name{"pool"};
        bool startImmediately{true};
    };

    ThreadPool();
    explicit ThreadPool(size_t numThreads);
    explicit ThreadPool(const Config& config);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Spawn the workers; no-op when already running
    void Start();

    /// Block until the queue is empty and no job is executing
    void Wait();

    /// Refuse new work, run what is queued, join the workers
    void Shutdown();

    bool IsRunning() const;
    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;
    size_t ActiveTasks() const;
    const std::string& Name() const { return config_.name; }

    /**
     * Queue f(args...) and return a future for its result.
     * Arguments are copied (or moved) into the job.
     * @throws std::runtime_error if the pool is not running or the queue is full
     */
    template<typename F, typename... Args>
    std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>>
    Submit(F&& f, Args&&... args) {
        using R = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;

        auto job = std::make_shared<std::packaged_task<R()>>(
            [fn = std::forward<F>(f),
             bound = std::make_tuple(std::forward<Args>(args)...)]() mutable -> R {
                return std::apply(fn, std::move(bound));
            });
        std::future<R> result = job->get_future();
        Enqueue([job]() { (*job)(); });
        return result;
    }

private:
    void Enqueue(std::function<void()> job);
    void WorkerLoop();

    Config config_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable workAvailable_;
    std::condition_variable idle_;
    std::queue<std::function<void()>> jobs_;
    size_t active_{0};
    bool running_{false};
};

// ============================================================================
// Global Pool
// ============================================================================

/// Process-wide pool, created with defaults ("global") on first use
ThreadPool& GetGlobalThreadPool();

/// Replace the global pool with one built from config
void InitGlobalThreadPool(const ThreadPool::Config& config);

void ShutdownGlobalThreadPool();

template<typename F, typename... Args>
auto AsyncOn(ThreadPool& pool, F&& f, Args&&... args) {
    return pool.Submit(std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto Async(F&& f, Args&&... args) {
    return GetGlobalThreadPool().Submit(std::forward<F>(f), std::forward<Args>(args)...);
}

/// Collect every result in order; the first stored exception is rethrown
template<typename T>
std::vector<T> WaitAll(std::vector<std::future<T>>& futures) {
    std::vector<T> results;
    results.reserve(futures.size());
    for (auto& f : futures) {
        results.push_back(f.get());
    }
    return results;
}

inline void WaitAll(std::vector<std::future<void>>& futures) {
    for (auto& f : futures) {
        f.get();
    }
}

} // namespace util
} // namespace keyseal

#endif // KEYSEAL_UTIL_THREADPOOL_H
