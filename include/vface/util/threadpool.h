// VFACE - Worker Pool
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Fixed set of worker threads draining a bounded FIFO queue. The RPC
// server hands each accepted connection to the pool; when the queue is
// full the connection is refused instead of piling up.

#ifndef VFACE_UTIL_THREADPOOL_H
#define VFACE_UTIL_THREADPOOL_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vface {
namespace util {

class ThreadPool {
public:
    using Task = std::function<void()>;

    struct Config {
        /// 0 picks std::thread::hardware_concurrency()
        size_t numThreads{0};
        size_t maxQueueSize{1024};
        /// Shown in log lines
        std::string name{"pool"};
    };

    /// Starts the workers immediately
    explicit ThreadPool(const Config& config);

    /// Same as Shutdown()
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Queue a task.
     * @return false if the pool is shutting down or the queue is full
     */
    bool TryExecute(Task task);

    /// Block until nothing is queued or running
    void Wait();

    /// Refuse new tasks, run the queued ones, then join the workers
    void Shutdown();

    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;

    /// Tasks that exited with an exception; each is logged
    uint64_t FailedTasks() const { return failed_.load(); }

private:
    void Run();

    const Config config_;
    std::vector<std::thread> workers_;

    mutable std::mutex mutex_;
    std::condition_variable workAvailable_;
    std::condition_variable idle_;
    std::deque<Task> queue_;
    size_t running_{0};
    bool stopping_{false};

    std::atomic<uint64_t> failed_{0};
};

} // namespace util
} // namespace vface

#endif // VFACE_UTIL_THREADPOOL_H
