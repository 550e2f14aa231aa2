#include <gtest/gtest.h>
#include "dsync/concurrency/thread_safe_queue.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using dsync::concurrency::ThreadSafeQueue;

TEST(ThreadSafeQueue, PushAndPopInOrder) {
    ThreadSafeQueue<int> queue;

    EXPECT_TRUE(queue.push(42));
    EXPECT_TRUE(queue.push(100));

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 42);

    auto second = queue.pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), 100);
}

TEST(ThreadSafeQueue, TryPop) {
    ThreadSafeQueue<int> queue;

    EXPECT_FALSE(queue.try_pop().has_value());

    queue.push(123);
    auto value = queue.try_pop();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 123);
}

TEST(ThreadSafeQueue, PopTimeout) {
    ThreadSafeQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    auto value = queue.pop_for(std::chrono::milliseconds(100));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    EXPECT_FALSE(value.has_value());
    EXPECT_GE(elapsed.count(), 90);
}

TEST(ThreadSafeQueue, Size) {
    ThreadSafeQueue<int> queue;

    EXPECT_EQ(queue.size(), 0u);
    EXPECT_TRUE(queue.empty());

    queue.push(1);
    queue.push(2);
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_FALSE(queue.empty());

    queue.pop();
    EXPECT_EQ(queue.size(), 1u);
}

TEST(ThreadSafeQueue, CloseDrainsThenStops) {
    ThreadSafeQueue<int> queue;
    queue.push(7);
    queue.close();

    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.push(8));

    auto drained = queue.pop();
    ASSERT_TRUE(drained.has_value());
    EXPECT_EQ(drained.value(), 7);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(ThreadSafeQueue, CloseWakesBlockedConsumer) {
    ThreadSafeQueue<int> queue;
    std::atomic<bool> returned{false};

    std::thread consumer([&]() {
        auto value = queue.pop();
        EXPECT_FALSE(value.has_value());
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(returned.load());
    queue.close();
    consumer.join();
    EXPECT_TRUE(returned.load());
}

TEST(ThreadSafeQueue, ProducerConsumer) {
    ThreadSafeQueue<int> queue;
    std::atomic<int> sum{0};

    std::thread producer([&queue]() {
        for (int i = 1; i <= 100; ++i) {
            queue.push(i);
        }
        queue.close();
    });

    std::thread consumer([&queue, &sum]() {
        while (auto value = queue.pop()) {
            sum += *value;
        }
    });

    producer.join();
    consumer.join();
    EXPECT_EQ(sum.load(), 5050);
}
