#include <gtest/gtest.h>
#include "dsync/concurrency/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using dsync::concurrency::WorkerPool;

TEST(WorkerPoolTest, RunsEverySubmittedJob) {
    std::atomic<int> done{0};
    WorkerPool pool(4);
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(pool.submit([&done]() { ++done; }));
    }
    pool.wait();
    EXPECT_EQ(done.load(), 50);
}

TEST(WorkerPoolTest, ZeroWorkersClampsToOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.size(), 1u);

    std::atomic<bool> ran{false};
    pool.submit([&ran]() { ran = true; });
    pool.wait();
    EXPECT_TRUE(ran.load());
}

TEST(WorkerPoolTest, NeverExceedsWorkerCount) {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    WorkerPool pool(3);
    for (int i = 0; i < 12; ++i) {
        pool.submit([&]() {
            const int now = ++active;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --active;
        });
    }
    pool.wait();

    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 2);
}

TEST(WorkerPoolTest, ThrowingJobDoesNotStopWorker) {
    std::atomic<int> done{0};
    WorkerPool pool(1);
    pool.submit([]() { throw std::runtime_error("boom"); });
    pool.submit([&done]() { ++done; });
    pool.wait();
    EXPECT_EQ(done.load(), 1);
}

TEST(WorkerPoolTest, SubmitAfterWaitIsRejected) {
    WorkerPool pool(2);
    pool.wait();
    EXPECT_FALSE(pool.submit([]() {}));
    pool.wait();
}
