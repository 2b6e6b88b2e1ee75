#pragma once

#include "qadt/core/periodic_timer.hpp"
#include "qadt/device/backend.hpp"
#include "qadt/device/transport_gate.hpp"
#include "qadt/device/types.hpp"
#include "qadt/events/event_bus.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <vector>

namespace qadt::device {

struct DeviceDiff {
    std::vector<Device> connected;     ///< In current, absent from previous
    std::vector<Device> disconnected;  ///< In previous, absent from current

    [[nodiscard]] bool empty() const noexcept { return connected.empty() && disconnected.empty(); }
};

/**
 * @brief Set difference of two device lists keyed by id
 *
 * Disconnected entries carry the previous snapshot. When a list reports the
 * same id twice the first occurrence wins.
 */
DeviceDiff diff_devices(const std::vector<Device>& previous, const std::vector<Device>& current);

// First occurrence of every id, order preserved
std::vector<Device> unique_by_id(const std::vector<Device>& devices);

/**
 * @brief Polls every backend and raises connect/disconnect edges
 *
 * One poll: query each registered backend through the transport gate (a
 * failing backend counts as zero devices for that cycle), diff against the
 * previous set, then emit DeviceConnectedEvent for each new id,
 * DeviceDisconnectedEvent for each vanished id and finally one
 * DevicesChangedEvent, only when something changed.
 *
 * Single flight: a poll requested while another is running is skipped.
 */
class DeviceMonitor {
public:
    DeviceMonitor(BackendRegistry& registry,
                  TransportGate& gate,
                  events::EventBus& bus,
                  std::chrono::milliseconds command_timeout);
    ~DeviceMonitor();

    DeviceMonitor(const DeviceMonitor&) = delete;
    DeviceMonitor& operator=(const DeviceMonitor&) = delete;

    // Restarts if already running; the first poll happens immediately
    void start_monitoring(std::chrono::milliseconds interval);
    void stop_monitoring();
    [[nodiscard]] bool monitoring() const { return timer_.running(); }

    /**
     * @brief Run one poll cycle on the calling thread
     * @return false if skipped because a poll was already in flight
     */
    bool poll_once();

    [[nodiscard]] std::vector<Device> current_devices() const;

private:
    std::vector<Device> query_backends();

    BackendRegistry& registry_;
    TransportGate& gate_;
    events::EventBus& bus_;
    std::chrono::milliseconds command_timeout_;

    std::atomic<bool> polling_{false};

    mutable std::mutex mutex_;
    std::vector<Device> current_;

    core::PeriodicTimer timer_;
};

} // namespace qadt::device
