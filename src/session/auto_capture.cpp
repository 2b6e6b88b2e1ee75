#include "qadt/session/auto_capture.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace qadt::session {

AutoCaptureComponent::AutoCaptureComponent(events::EventBus& bus, SessionManager& manager, bool enabled)
    : manager_(manager), enabled_(enabled) {
    connected_ = bus.subscribe_scoped<events::DeviceConnectedEvent>(
        [this](const events::DeviceConnectedEvent& e) { on_connected(e); });
    disconnected_ = bus.subscribe_scoped<events::DeviceDisconnectedEvent>(
        [this](const events::DeviceDisconnectedEvent& e) { on_disconnected(e); });
}

std::vector<SessionPtr> AutoCaptureComponent::sessions() const {
    std::lock_guard lock(mutex_);
    return sessions_;
}

void AutoCaptureComponent::on_connected(const events::DeviceConnectedEvent& event) {
    if (!enabled_) {
        return;
    }
    const auto& device = event.device;
    if (manager_.active_session_for_device(device.id)) {
        spdlog::debug("[AutoCapture] {} is already capturing", device.id);
        return;
    }

    auto created = manager_.create_session(device);
    if (created.is_error()) {
        spdlog::error("[AutoCapture] No session for {}: {}", device.id, created.error().describe());
        return;
    }
    auto session = created.value();
    if (!manager_.start_capture(session)) {
        spdlog::warn("[AutoCapture] Capture of {} did not start", device.id);
        if (!manager_.delete_session(session)) {
            spdlog::warn("[AutoCapture] Could not remove {}", session->session_directory().string());
        }
        return;
    }

    std::lock_guard lock(mutex_);
    sessions_.push_back(std::move(session));
}

void AutoCaptureComponent::on_disconnected(const events::DeviceDisconnectedEvent& event) {
    auto known = sessions();
    for (auto& active : manager_.active_sessions()) {
        known.push_back(std::move(active));
    }
    if (auto stopped = manager_.stop_capture_for_device(event.device.id, known)) {
        spdlog::info("[AutoCapture] Stopped session {} of {}", stopped->session_id(), event.device.id);
    }

    // Stopped sessions stay reachable on disk through get_saved_sessions
    std::lock_guard lock(mutex_);
    sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                   [](const SessionPtr& s) { return s->status() == SessionStatus::Stopped; }),
                    sessions_.end());
}

} // namespace qadt::session
