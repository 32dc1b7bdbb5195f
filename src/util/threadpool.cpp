// VFACE - Worker Pool Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/util/threadpool.h"
#include "vface/util/logging.h"

#include <algorithm>
#include <exception>

namespace vface {
namespace util {

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    size_t count = config_.numThreads;
    if (count == 0) {
        count = std::max(2u, std::thread::hardware_concurrency());
    }
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this] { Run(); });
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

bool ThreadPool::TryExecute(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || queue_.size() >= config_.maxQueueSize) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    workAvailable_.notify_one();
    return true;
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    workAvailable_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
    workers_.clear();
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ThreadPool::Run() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        workAvailable_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        // Queued work is finished even after Shutdown()
        if (queue_.empty()) {
            return;
        }
        Task task = std::move(queue_.front());
        queue_.pop_front();
        ++running_;

        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            failed_.fetch_add(1);
            LOG_ERROR(LogCategory::RPC) << "Task in " << config_.name << " pool failed: " << e.what();
        }
        lock.lock();

        --running_;
        if (queue_.empty() && running_ == 0) {
            idle_.notify_all();
        }
    }
}

} // namespace util
} // namespace vface
