#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>

#include "dash/thread_pool.hpp"

using dash::ThreadPool;

TEST(ThreadPool, RunsEveryTaskBeforeWaitReturns) {
    std::atomic<int> done(0);
    ThreadPool pool(4);
    for (int i = 0; i < 100; ++i) {
        pool.enqueue([&done] { done++; });
    }
    pool.wait();
    EXPECT_EQ(done.load(), 100);
}

TEST(ThreadPool, WaitForTimesOutWhileTaskRuns) {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    ThreadPool pool(2);
    pool.enqueue([gate] { gate.wait(); });

    EXPECT_FALSE(pool.wait_for(std::chrono::milliseconds(50)));
    release.set_value();
    EXPECT_TRUE(pool.wait_for(std::chrono::seconds(5)));
}

TEST(ThreadPool, WaitOnIdlePoolReturnsImmediately) {
    ThreadPool pool(1);
    EXPECT_TRUE(pool.wait_for(std::chrono::milliseconds(0)));
    pool.wait();
}

TEST(ThreadPool, ZeroSizeStillHasOneThread) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    std::atomic<bool> ran(false);
    pool.enqueue([&ran] { ran = true; });
    pool.wait();
    EXPECT_TRUE(ran.load());
}

TEST(ThreadPool, DestructorDrainsQueue) {
    std::atomic<int> done(0);
    {
        ThreadPool pool(2);
        for (int i = 0; i < 20; ++i) {
            pool.enqueue([&done] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                done++;
            });
        }
    }
    EXPECT_EQ(done.load(), 20);
}
