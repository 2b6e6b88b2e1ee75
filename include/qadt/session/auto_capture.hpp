#pragma once

#include "qadt/events/event_bus.hpp"
#include "qadt/events/events.hpp"
#include "qadt/session/manager.hpp"

#include <atomic>
#include <mutex>
#include <vector>

namespace qadt::session {

/**
 * @brief Starts a capture for every device that connects and stops it when
 *        the device goes away
 *
 * Holds the sessions it started while they capture. A start that fails
 * removes the new session directory, and each disconnect drops stopped
 * sessions from the list. Handlers run on the thread that emits the device
 * events (the monitor's poll thread).
 */
class AutoCaptureComponent {
public:
    AutoCaptureComponent(events::EventBus& bus, SessionManager& manager, bool enabled = true);

    AutoCaptureComponent(const AutoCaptureComponent&) = delete;
    AutoCaptureComponent& operator=(const AutoCaptureComponent&) = delete;

    void set_enabled(bool enabled) noexcept { enabled_ = enabled; }
    [[nodiscard]] bool enabled() const noexcept { return enabled_.load(); }

    [[nodiscard]] std::vector<SessionPtr> sessions() const;

private:
    void on_connected(const events::DeviceConnectedEvent& event);
    void on_disconnected(const events::DeviceDisconnectedEvent& event);

    SessionManager& manager_;
    std::atomic<bool> enabled_;

    mutable std::mutex mutex_;
    std::vector<SessionPtr> sessions_;

    // Last so they are released before the state the handlers touch
    events::Subscription connected_;
    events::Subscription disconnected_;
};

} // namespace qadt::session
