#include "qadt/core/periodic_timer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace qadt::core {

PeriodicTimer::PeriodicTimer(std::string name) : name_(std::move(name)) {}

PeriodicTimer::~PeriodicTimer() {
    stop();
    std::lock_guard lock(mutex_);
    reap_retired_locked();
}

void PeriodicTimer::start(std::chrono::milliseconds interval, Callback callback, bool fire_immediately) {
    stop();

    auto run = std::make_unique<Run>();
    run->callback = std::move(callback);
    run->interval = interval;
    arm(run.get(), fire_immediately ? std::chrono::milliseconds{0} : interval, name_);

    Run* raw = run.get();
    run->thread = std::thread([raw] { raw->io.run(); });

    std::lock_guard lock(mutex_);
    reap_retired_locked();
    run_ = std::move(run);
    spdlog::debug("[Timer:{}] started, interval={}ms", name_, interval.count());
}

void PeriodicTimer::stop() {
    std::unique_ptr<Run> run;
    {
        std::lock_guard lock(mutex_);
        run = std::move(run_);
    }
    if (!run) {
        return;
    }

    run->active = false;
    run->io.stop();

    if (run->thread.get_id() == std::this_thread::get_id()) {
        // Stopping from inside our own callback: the handler is still on the stack
        std::lock_guard lock(mutex_);
        retired_.push_back(std::move(run));
        return;
    }

    if (run->thread.joinable()) {
        run->thread.join();
    }
    spdlog::debug("[Timer:{}] stopped", name_);
}

bool PeriodicTimer::running() const {
    std::lock_guard lock(mutex_);
    return run_ != nullptr;
}

void PeriodicTimer::arm(Run* run, std::chrono::milliseconds delay, const std::string& name) {
    run->timer.expires_after(delay);
    run->timer.async_wait([run, name](const boost::system::error_code& ec) {
        if (ec || !run->active) {
            return;
        }
        try {
            run->callback();
        } catch (const std::exception& e) {
            spdlog::error("[Timer:{}] callback threw: {}", name, e.what());
        }
        if (run->active) {
            arm(run, run->interval, name);
        }
    });
}

void PeriodicTimer::reap_retired_locked() {
    for (auto& retired : retired_) {
        if (retired->thread.joinable() && retired->thread.get_id() != std::this_thread::get_id()) {
            retired->thread.join();
        }
    }
    // A run whose thread is the caller cannot be destroyed yet
    retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                  [](const std::unique_ptr<Run>& r) { return !r->thread.joinable(); }),
                   retired_.end());
}

} // namespace qadt::core
