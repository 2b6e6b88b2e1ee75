/**
 * @file events.hpp
 * @brief Event types exchanged between the monitor, the session manager
 *        and their consumers
 *
 * NAMING CONVENTION:
 * Events are past-tense: DeviceConnectedEvent, CaptureStoppedEvent
 *
 * ORDER PER POLL CYCLE:
 * every DeviceConnectedEvent, then every DeviceDisconnectedEvent, then one
 * DevicesChangedEvent, all before the next poll may start.
 */

#pragma once

#include "qadt/device/types.hpp"
#include "qadt/session/types.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace qadt::events {

// ════════════════════════════════════════════════════════
// Device Events (emitted by DeviceMonitor)
// ════════════════════════════════════════════════════════

/**
 * @brief Full attached-device list after a poll that changed something
 *
 * Never emitted for a poll whose diff is empty.
 */
struct DevicesChangedEvent {
    std::vector<device::Device> devices;
    std::chrono::system_clock::time_point timestamp;

    explicit DevicesChangedEvent(std::vector<device::Device> list)
        : devices(std::move(list)),
          timestamp(std::chrono::system_clock::now()) {}
};

/**
 * @brief A device id appeared that was absent on the previous poll
 *
 * WHO SUBSCRIBES:
 * - AutoCaptureComponent (create and start a session)
 * - LoggerComponent
 */
struct DeviceConnectedEvent {
    device::Device device;
    std::chrono::system_clock::time_point timestamp;

    explicit DeviceConnectedEvent(device::Device d)
        : device(std::move(d)),
          timestamp(std::chrono::system_clock::now()) {}
};

/**
 * @brief A device id present on the previous poll is gone
 *
 * Carries the last snapshot seen for that id.
 */
struct DeviceDisconnectedEvent {
    device::Device device;
    std::chrono::system_clock::time_point timestamp;

    explicit DeviceDisconnectedEvent(device::Device d)
        : device(std::move(d)),
          timestamp(std::chrono::system_clock::now()) {}
};

// ════════════════════════════════════════════════════════
// Session Events (emitted by SessionManager)
// ════════════════════════════════════════════════════════

/**
 * @brief One flush-timer tick worth of captured lines
 *
 * text is newline-joined and holds at most max_batch_lines lines, in the
 * order the capture process produced them.
 */
struct LogBatchReceivedEvent {
    std::string text;
    std::size_t line_count = 0;
};

struct CaptureStartedEvent {
    session::SessionInfo session;
};

struct CaptureStoppedEvent {
    session::SessionInfo session;
    std::string reason;  // "requested", "device_disconnected", "process_exited", "shutdown"
};

// Emitted after create/start/stop/delete; consumers re-query the list
struct SessionListChangedEvent {
    std::string session_id;
};

} // namespace qadt::events
