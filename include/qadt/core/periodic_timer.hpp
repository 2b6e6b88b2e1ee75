#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace qadt::core {

/**
 * @brief Fixed-delay repeating timer on its own io_context thread
 *
 * Used for the device poll loop and the log batch flush. The callback
 * never overlaps itself: the next tick is armed only after the current
 * callback returns.
 *
 * stop() joins the timer thread, except when called from inside the
 * callback; in that case the run is retired and joined on the next
 * start() or on destruction.
 */
class PeriodicTimer {
public:
    using Callback = std::function<void()>;

    explicit PeriodicTimer(std::string name);
    ~PeriodicTimer();

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    /**
     * @brief Start ticking; a previous run is stopped first
     *
     * @param interval Delay between the end of one callback and the next
     * @param callback Invoked on the timer thread; exceptions are logged
     * @param fire_immediately First tick without waiting one interval
     */
    void start(std::chrono::milliseconds interval, Callback callback, bool fire_immediately = false);

    void stop();

    [[nodiscard]] bool running() const;

private:
    struct Run {
        boost::asio::io_context io;
        boost::asio::steady_timer timer{io};
        Callback callback;
        std::chrono::milliseconds interval{0};
        std::atomic<bool> active{true};
        std::thread thread;
    };

    static void arm(Run* run, std::chrono::milliseconds delay, const std::string& name);
    void reap_retired_locked();

    std::string name_;
    mutable std::mutex mutex_;
    std::unique_ptr<Run> run_;
    std::vector<std::unique_ptr<Run>> retired_;
};

} // namespace qadt::core
