#include <gtest/gtest.h>
#include "rpl/events/event_queue.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace rpl::events;

TEST(ThreadSafeQueue, PopsInPushOrder) {
    ThreadSafeQueue<int> queue;

    queue.push(42);
    queue.push(100);

    EXPECT_EQ(queue.pop().value(), 42);
    EXPECT_EQ(queue.pop().value(), 100);
}

TEST(ThreadSafeQueue, TryPopOnEmpty) {
    ThreadSafeQueue<int> queue;

    EXPECT_FALSE(queue.try_pop().has_value());
    queue.push(7);
    EXPECT_EQ(queue.try_pop().value(), 7);
}

TEST(ThreadSafeQueue, PopForTimesOut) {
    ThreadSafeQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    auto val = queue.pop_for(std::chrono::milliseconds(100));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    EXPECT_FALSE(val.has_value());
    EXPECT_GE(elapsed.count(), 90);
}

TEST(ThreadSafeQueue, PopForWakesOnPush) {
    ThreadSafeQueue<int> queue;

    std::thread producer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.push(5);
    });
    auto val = queue.pop_for(std::chrono::seconds(5));
    producer.join();

    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(*val, 5);
}

TEST(ThreadSafeQueue, CloseUnblocksConsumers) {
    ThreadSafeQueue<int> queue;

    std::thread closer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.close();
    });
    auto val = queue.pop();
    closer.join();

    EXPECT_FALSE(val.has_value());
}

TEST(ThreadSafeQueue, ClosedQueueStillHandsOutItems) {
    ThreadSafeQueue<int> queue;
    queue.push(1);
    queue.close();

    EXPECT_EQ(queue.pop().value(), 1);
    EXPECT_FALSE(queue.pop().has_value());
    EXPECT_FALSE(queue.pop_for(std::chrono::seconds(5)).has_value());
}

TEST(ThreadSafeQueue, DrainTakesEverything) {
    ThreadSafeQueue<std::string> queue;
    queue.push("a");
    queue.push("b");
    queue.push("c");

    auto all = queue.drain();

    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all.front(), "a");
    EXPECT_EQ(all.back(), "c");
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_TRUE(queue.drain().empty());
}

TEST(ThreadSafeQueue, ProducerConsumer) {
    ThreadSafeQueue<int> queue;
    std::atomic<int> sum{0};

    std::thread producer([&queue]() {
        for (int i = 0; i < 100; ++i) {
            queue.push(i);
        }
        queue.close();
    });
    std::thread consumer([&queue, &sum]() {
        while (auto val = queue.pop()) {
            sum += *val;
        }
    });

    producer.join();
    consumer.join();

    EXPECT_EQ(sum, 4950);
}
