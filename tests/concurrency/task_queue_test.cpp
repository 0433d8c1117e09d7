#include <gtest/gtest.h>
#include "pbu/concurrency/task_queue.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace pbu::concurrency;

TEST(TaskQueue, PushAndPopInOrder) {
    TaskQueue<int> queue;

    EXPECT_TRUE(queue.push(42));
    EXPECT_TRUE(queue.push(100));

    auto val1 = queue.pop();
    ASSERT_TRUE(val1.has_value());
    EXPECT_EQ(val1.value(), 42);

    auto val2 = queue.pop();
    ASSERT_TRUE(val2.has_value());
    EXPECT_EQ(val2.value(), 100);
}

TEST(TaskQueue, Size) {
    TaskQueue<int> queue;

    EXPECT_EQ(queue.size(), 0u);
    queue.push(1);
    queue.push(2);
    EXPECT_EQ(queue.size(), 2u);

    queue.pop();
    EXPECT_EQ(queue.size(), 1u);
}

TEST(TaskQueue, CloseDrainsRemainingItems) {
    TaskQueue<int> queue;
    queue.push(7);
    queue.push(8);

    queue.close();
    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.push(9));  // Rejected after close

    EXPECT_EQ(queue.pop().value_or(-1), 7);
    EXPECT_EQ(queue.pop().value_or(-1), 8);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(TaskQueue, CloseWakesBlockedConsumer) {
    TaskQueue<int> queue;
    std::atomic<bool> returned{false};

    std::thread consumer([&]() {
        auto val = queue.pop();
        EXPECT_FALSE(val.has_value());
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(returned);

    queue.close();
    consumer.join();
    EXPECT_TRUE(returned);
}

TEST(TaskQueue, ProducerConsumer) {
    TaskQueue<int> queue;
    std::atomic<int> sum{0};

    std::thread producer([&queue]() {
        for (int i = 1; i <= 100; ++i) {
            queue.push(i);
        }
        queue.close();
    });

    std::vector<std::thread> consumers;
    for (int c = 0; c < 3; ++c) {
        consumers.emplace_back([&queue, &sum]() {
            while (auto val = queue.pop()) {
                sum += *val;
            }
        });
    }

    producer.join();
    for (auto& t : consumers) {
        t.join();
    }

    EXPECT_EQ(sum.load(), 5050);
}
