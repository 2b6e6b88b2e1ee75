#include <gtest/gtest.h>
#include "qadt/events/components.hpp"
#include "qadt/events/inbox_queue.hpp"
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace qadt::events;
using namespace std::chrono_literals;

TEST(InboxQueue, FullQueueEvictsOldest) {
    InboxQueue<int> queue(3);
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_TRUE(queue.push(3));
    EXPECT_FALSE(queue.push(4));
    EXPECT_FALSE(queue.push(5));

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.dropped(), 2u);
    EXPECT_EQ(queue.try_pop(), 3);
    EXPECT_EQ(queue.try_pop(), 4);
    EXPECT_EQ(queue.try_pop(), 5);
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(InboxQueue, ZeroCapacityHoldsOne) {
    InboxQueue<std::string> queue(0);
    EXPECT_EQ(queue.capacity(), 1u);
    queue.push("old");
    queue.push("new");
    EXPECT_EQ(queue.try_pop(), "new");
    EXPECT_EQ(queue.dropped(), 1u);
}

TEST(InboxQueue, PopForTimesOutWhenEmpty) {
    InboxQueue<int> queue(4);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.pop_for(100ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 90ms);
}

TEST(InboxQueue, ClosedQueueRejectsPushButDrains) {
    InboxQueue<int> queue(4);
    queue.push(7);
    queue.close();

    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.push(8));
    EXPECT_EQ(queue.dropped(), 0u);

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(queue.pop_for(5s), 7);
    EXPECT_FALSE(queue.pop_for(5s).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(InboxQueue, SlowConsumerSeesNewestAndCountsTheRest) {
    InboxQueue<int> queue(10);

    std::thread producer([&queue]() {
        for (int i = 0; i < 1000; ++i) {
            queue.push(i);
        }
    });
    producer.join();

    std::vector<int> received;
    while (auto value = queue.try_pop()) {
        received.push_back(*value);
    }
    ASSERT_EQ(received.size(), 10u);
    EXPECT_EQ(received.front(), 990);
    EXPECT_EQ(received.back(), 999);
    EXPECT_EQ(queue.dropped(), 990u);
}

TEST(EventInbox, BoundedInboxDropsOldestBatches) {
    EventBus bus;
    EventInbox<LogBatchReceivedEvent> inbox(bus, 2);

    bus.emit(LogBatchReceivedEvent{"a", 1});
    bus.emit(LogBatchReceivedEvent{"b", 1});
    bus.emit(LogBatchReceivedEvent{"c", 1});

    EXPECT_EQ(inbox.size(), 2u);
    EXPECT_EQ(inbox.dropped(), 1u);
    auto first = inbox.try_next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->text, "b");
}

TEST(EventInbox, ClosedInboxIgnoresLaterEvents) {
    EventBus bus;
    EventInbox<LogBatchReceivedEvent> inbox(bus);

    bus.emit(LogBatchReceivedEvent{"kept", 1});
    inbox.close();
    bus.emit(LogBatchReceivedEvent{"late", 1});

    EXPECT_EQ(inbox.size(), 1u);
    EXPECT_EQ(inbox.next_for(10ms)->text, "kept");
    EXPECT_FALSE(inbox.next_for(10ms).has_value());
}

TEST(EventInbox, ConsumerThreadReceivesInOrder) {
    EventBus bus;
    EventInbox<LogBatchReceivedEvent> inbox(bus);

    std::vector<std::string> received;
    std::thread consumer([&]() {
        while (received.size() < 100) {
            if (auto batch = inbox.next_for(2s)) {
                received.push_back(batch->text);
            } else {
                break;
            }
        }
    });
    for (int i = 0; i < 100; ++i) {
        bus.emit(LogBatchReceivedEvent{std::to_string(i), 1});
    }
    consumer.join();

    ASSERT_EQ(received.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(received[i], std::to_string(i));
    }
    EXPECT_EQ(inbox.dropped(), 0u);
}
