/**
 * @file components.hpp
 * @brief Reusable event-driven consumers
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);                  // logs every device/session event
 * EventInbox<LogBatchReceivedEvent> inbox(bus); // poll batches from any thread
 */

#pragma once

#include "qadt/events/event_bus.hpp"
#include "qadt/events/events.hpp"
#include "qadt/events/inbox_queue.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace qadt::events {

/**
 * @brief Logs device and session events with spdlog
 *
 * Log batches are logged at debug level only.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe_scoped<DeviceConnectedEvent>(
            [](const DeviceConnectedEvent& e) {
                spdlog::info("[DeviceConnected] id={} name={} platform={} state={}",
                             e.device.id, e.device.label(), device::platform_name(e.device.platform),
                             device::connection_state_name(e.device.connection_state));
            }));

        subscriptions_.push_back(bus.subscribe_scoped<DeviceDisconnectedEvent>(
            [](const DeviceDisconnectedEvent& e) {
                spdlog::info("[DeviceDisconnected] id={} name={}", e.device.id, e.device.label());
            }));

        subscriptions_.push_back(bus.subscribe_scoped<DevicesChangedEvent>(
            [](const DevicesChangedEvent& e) {
                spdlog::info("[DevicesChanged] attached={}", e.devices.size());
            }));

        subscriptions_.push_back(bus.subscribe_scoped<CaptureStartedEvent>(
            [](const CaptureStartedEvent& e) {
                spdlog::info("[CaptureStarted] session={} device={} file={}",
                             e.session.session_id, e.session.device_id, e.session.log_file_path.string());
            }));

        subscriptions_.push_back(bus.subscribe_scoped<CaptureStoppedEvent>(
            [](const CaptureStoppedEvent& e) {
                spdlog::info("[CaptureStopped] session={} device={} lines={} reason={}",
                             e.session.session_id, e.session.device_id, e.session.line_count, e.reason);
            }));

        subscriptions_.push_back(bus.subscribe_scoped<SessionListChangedEvent>(
            [](const SessionListChangedEvent& e) {
                spdlog::debug("[SessionListChanged] session={}", e.session_id);
            }));

        subscriptions_.push_back(bus.subscribe_scoped<LogBatchReceivedEvent>(
            [](const LogBatchReceivedEvent& e) {
                spdlog::debug("[LogBatch] lines={} bytes={}", e.line_count, e.text.size());
            }));
    }

private:
    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Queues one event type for consumers that poll instead of
 *        registering callbacks
 *
 * Bounded: when the consumer falls `capacity` events behind, the oldest
 * queued event is dropped and counted. The subscription lives as long as
 * the inbox.
 */
template<typename EventType>
class EventInbox {
public:
    static constexpr std::size_t kDefaultCapacity = 1024;

    explicit EventInbox(EventBus& bus, std::size_t capacity = kDefaultCapacity)
        : queue_(capacity),
          subscription_(bus.subscribe_scoped<EventType>(
              [this](const EventType& e) { queue_.push(e); })) {}

    ~EventInbox() {
        subscription_.reset();
        queue_.close();
    }

    EventInbox(const EventInbox&) = delete;
    EventInbox& operator=(const EventInbox&) = delete;

    std::optional<EventType> try_next() { return queue_.try_pop(); }

    template<typename Rep, typename Period>
    std::optional<EventType> next_for(const std::chrono::duration<Rep, Period>& timeout) {
        return queue_.pop_for(timeout);
    }

    std::size_t size() const { return queue_.size(); }

    // Events evicted because the consumer fell behind
    std::size_t dropped() const { return queue_.dropped(); }

    // Wake a consumer blocked in next_for; later events are not queued
    void close() { queue_.close(); }

private:
    InboxQueue<EventType> queue_;
    Subscription subscription_;
};

} // namespace qadt::events
