#include "qadt/session/log_buffer.hpp"

#include <gtest/gtest.h>

#include <map>
#include <thread>
#include <vector>

using qadt::session::LogDeliveryQueue;

TEST(LogDeliveryQueue, PopsInPushOrder) {
    LogDeliveryQueue queue(16);
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(queue.try_push("line " + std::to_string(i)));
    }
    EXPECT_EQ(queue.size(), 10u);

    auto first = queue.drain(4);
    ASSERT_EQ(first.size(), 4u);
    EXPECT_EQ(first.front(), "line 0");
    EXPECT_EQ(first.back(), "line 3");

    auto rest = queue.drain(100);
    ASSERT_EQ(rest.size(), 6u);
    EXPECT_EQ(rest.back(), "line 9");
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(LogDeliveryQueue, DropsWhenFull) {
    LogDeliveryQueue queue(3);
    EXPECT_TRUE(queue.try_push("a"));
    EXPECT_TRUE(queue.try_push("b"));
    EXPECT_TRUE(queue.try_push("c"));
    EXPECT_FALSE(queue.try_push("d"));
    EXPECT_FALSE(queue.try_push("e"));
    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.dropped(), 2u);

    EXPECT_EQ(queue.try_pop(), "a");
    EXPECT_TRUE(queue.try_push("f"));
    EXPECT_EQ(queue.drain(10), (std::vector<std::string>{"b", "c", "f"}));
}

TEST(LogDeliveryQueue, ZeroCapacityHoldsOne) {
    LogDeliveryQueue queue(0);
    EXPECT_EQ(queue.capacity(), 1u);
    EXPECT_TRUE(queue.try_push("only"));
    EXPECT_FALSE(queue.try_push("extra"));
}

TEST(LogDeliveryQueue, ConcurrentProducersKeepPerProducerOrder) {
    constexpr int kProducers = 4;
    constexpr int kLinesEach = 5000;
    LogDeliveryQueue queue(kProducers * kLinesEach);

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&queue, p] {
            for (int i = 0; i < kLinesEach; ++i) {
                queue.try_push(std::to_string(p) + ":" + std::to_string(i));
            }
        });
    }

    std::map<int, int> next_expected;
    std::size_t received = 0;
    bool ordered = true;
    auto consume = [&] {
        for (auto& line : queue.drain(512)) {
            const auto colon = line.find(':');
            const int producer = std::stoi(line.substr(0, colon));
            const int index = std::stoi(line.substr(colon + 1));
            if (index != next_expected[producer]) {
                ordered = false;
            }
            next_expected[producer] = index + 1;
            ++received;
        }
    };

    const auto total = static_cast<std::size_t>(kProducers * kLinesEach);
    while (received < total) {
        consume();
        std::this_thread::yield();
    }
    for (auto& t : producers) {
        t.join();
    }

    EXPECT_TRUE(ordered);
    EXPECT_EQ(received, static_cast<std::size_t>(kProducers * kLinesEach));
    EXPECT_EQ(queue.dropped(), 0u);
    EXPECT_TRUE(queue.empty());
}
