// VFACE - Worker Pool Tests
// Copyright (c) 2024 VFACE Developers
// MIT License

#include <gtest/gtest.h>

#include "vface/util/threadpool.h"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>

namespace vface {
namespace util {
namespace test {

TEST(ThreadPoolTest, RunsEveryTask) {
    ThreadPool::Config config;
    config.numThreads = 4;
    ThreadPool pool(config);
    EXPECT_EQ(pool.ThreadCount(), 4u);

    std::atomic<int> sum{0};
    for (int i = 1; i <= 100; ++i) {
        ASSERT_TRUE(pool.TryExecute([&sum, i] { sum += i; }));
    }
    pool.Wait();
    EXPECT_EQ(sum.load(), 5050);
    EXPECT_EQ(pool.PendingTasks(), 0u);
}

TEST(ThreadPoolTest, RejectsWhenQueueIsFull) {
    ThreadPool::Config config;
    config.numThreads = 1;
    config.maxQueueSize = 1;
    ThreadPool pool(config);

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;

    ASSERT_TRUE(pool.TryExecute([gate, &started] {
        started.set_value();
        gate.wait();
    }));
    started.get_future().wait();

    EXPECT_TRUE(pool.TryExecute([] {}));
    EXPECT_FALSE(pool.TryExecute([] {}));

    release.set_value();
    pool.Wait();
    EXPECT_TRUE(pool.TryExecute([] {}));
}

TEST(ThreadPoolTest, FailedTasksAreCounted) {
    ThreadPool::Config config;
    config.numThreads = 2;
    ThreadPool pool(config);

    ASSERT_TRUE(pool.TryExecute([] { throw std::runtime_error("boom"); }));
    ASSERT_TRUE(pool.TryExecute([] {}));
    pool.Wait();
    EXPECT_EQ(pool.FailedTasks(), 1u);
}

TEST(ThreadPoolTest, ShutdownDrainsQueueAndRefusesNewWork) {
    ThreadPool::Config config;
    config.numThreads = 1;
    ThreadPool pool(config);

    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(pool.TryExecute([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++done;
        }));
    }
    pool.Shutdown();
    EXPECT_EQ(done.load(), 10);
    EXPECT_FALSE(pool.TryExecute([] {}));
    pool.Shutdown();
}

} // namespace test
} // namespace util
} // namespace vface
