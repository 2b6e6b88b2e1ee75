#include "qadt/core/periodic_timer.hpp"

#include "support/test_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

using namespace std::chrono_literals;
using qadt::core::PeriodicTimer;
using qadt::test_support::wait_until;

TEST(PeriodicTimer, TicksRepeatedly) {
    PeriodicTimer timer("test");
    std::atomic<int> ticks{0};
    timer.start(20ms, [&] { ++ticks; });
    EXPECT_TRUE(timer.running());
    EXPECT_TRUE(wait_until([&] { return ticks >= 3; }));
    timer.stop();
    EXPECT_FALSE(timer.running());

    const int after_stop = ticks;
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(ticks, after_stop);
}

TEST(PeriodicTimer, FireImmediately) {
    PeriodicTimer timer("test");
    std::atomic<int> ticks{0};
    timer.start(10s, [&] { ++ticks; }, true);
    EXPECT_TRUE(wait_until([&] { return ticks == 1; }, 1000ms));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(ticks, 1);
}

TEST(PeriodicTimer, CallbackNeverOverlaps) {
    PeriodicTimer timer("test");
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    std::atomic<int> ticks{0};
    timer.start(1ms, [&] {
        const int now = ++inside;
        if (now > max_inside) {
            max_inside = now;
        }
        std::this_thread::sleep_for(5ms);
        --inside;
        ++ticks;
    });
    EXPECT_TRUE(wait_until([&] { return ticks >= 10; }));
    timer.stop();
    EXPECT_EQ(max_inside, 1);
}

TEST(PeriodicTimer, ExceptionDoesNotStopTicking) {
    PeriodicTimer timer("test");
    std::atomic<int> ticks{0};
    timer.start(10ms, [&] {
        ++ticks;
        throw std::runtime_error("boom");
    });
    EXPECT_TRUE(wait_until([&] { return ticks >= 3; }));
}

TEST(PeriodicTimer, StopFromInsideCallback) {
    PeriodicTimer timer("test");
    std::atomic<int> ticks{0};
    timer.start(10ms, [&] {
        if (++ticks == 2) {
            timer.stop();
        }
    });
    EXPECT_TRUE(wait_until([&] { return !timer.running(); }));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(ticks, 2);

    timer.start(10ms, [&] { ++ticks; });
    EXPECT_TRUE(wait_until([&] { return ticks >= 4; }));
}

TEST(PeriodicTimer, RestartReplacesCallback) {
    PeriodicTimer timer("test");
    std::atomic<int> first{0};
    std::atomic<int> second{0};
    timer.start(10ms, [&] { ++first; });
    EXPECT_TRUE(wait_until([&] { return first >= 1; }));
    timer.start(10ms, [&] { ++second; });
    const int frozen = first;
    EXPECT_TRUE(wait_until([&] { return second >= 2; }));
    EXPECT_EQ(first, frozen);
}
