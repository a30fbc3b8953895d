/**
 * @file test_event_queue.cpp
 * @brief Unit tests for EventQueue.
 */

#include "transport/event_queue.hpp"

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace server_browser;

TEST(EventQueueTest, TryPopOnEmptyReturnsNothing) {
    EventQueue<int> queue;
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(EventQueueTest, PreservesEnqueueOrder) {
    EventQueue<std::string> queue;
    queue.push("a");
    queue.push("b");
    queue.push("c");

    EXPECT_EQ(*queue.try_pop(), "a");
    auto rest = queue.drain();
    EXPECT_EQ(rest, (std::vector<std::string>{"b", "c"}));
    EXPECT_TRUE(queue.empty());
}

TEST(EventQueueTest, DrainOnEmptyReturnsEmpty) {
    EventQueue<int> queue;
    EXPECT_TRUE(queue.drain().empty());
}

TEST(EventQueueTest, CloseRejectsNewEventsButKeepsQueued) {
    EventQueue<int> queue;
    EXPECT_TRUE(queue.push(1));
    queue.close();
    EXPECT_TRUE(queue.is_closed());
    EXPECT_FALSE(queue.push(2));

    auto events = queue.drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], 1);
}

TEST(EventQueueTest, ConcurrentProducers) {
    EventQueue<int> queue;
    constexpr int PRODUCERS = 4;
    constexpr int PER_PRODUCER = 1000;

    std::vector<std::thread> producers;
    for (int p = 0; p < PRODUCERS; ++p) {
        producers.emplace_back([&queue, p] {
            for (int i = 0; i < PER_PRODUCER; ++i) queue.push(p * PER_PRODUCER + i);
        });
    }

    size_t drained = 0;
    std::vector<int> last_seen(PRODUCERS, -1);
    auto consume = [&] {
        for (int value : queue.drain()) {
            int producer = value / PER_PRODUCER;
            // Per-producer order survives interleaving.
            EXPECT_GT(value, last_seen[producer]);
            last_seen[producer] = value;
            ++drained;
        }
    };

    for (auto& t : producers) {
        consume();
        t.join();
    }
    consume();

    EXPECT_EQ(drained, static_cast<size_t>(PRODUCERS * PER_PRODUCER));
}
