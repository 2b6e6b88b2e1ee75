#include "qadt/device/monitor.hpp"

#include "qadt/events/events.hpp"

#include <spdlog/spdlog.h>

#include <iterator>
#include <unordered_set>

namespace qadt::device {
namespace {

// Clears the in-flight flag however the poll ends
class PollGuard {
public:
    explicit PollGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~PollGuard() { flag_.store(false); }

    PollGuard(const PollGuard&) = delete;
    PollGuard& operator=(const PollGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

std::vector<Device> unique_by_id(const std::vector<Device>& devices) {
    std::vector<Device> unique;
    std::unordered_set<std::string> seen;
    unique.reserve(devices.size());
    for (const auto& device : devices) {
        if (seen.insert(device.id).second) {
            unique.push_back(device);
        }
    }
    return unique;
}

DeviceDiff diff_devices(const std::vector<Device>& previous, const std::vector<Device>& current) {
    const auto before = unique_by_id(previous);
    const auto now = unique_by_id(current);

    std::unordered_set<std::string> before_ids;
    for (const auto& device : before) {
        before_ids.insert(device.id);
    }
    std::unordered_set<std::string> now_ids;
    for (const auto& device : now) {
        now_ids.insert(device.id);
    }

    DeviceDiff diff;
    for (const auto& device : now) {
        if (before_ids.count(device.id) == 0) {
            diff.connected.push_back(device);
        }
    }
    for (const auto& device : before) {
        if (now_ids.count(device.id) == 0) {
            diff.disconnected.push_back(device);
        }
    }
    return diff;
}

DeviceMonitor::DeviceMonitor(BackendRegistry& registry,
                             TransportGate& gate,
                             events::EventBus& bus,
                             std::chrono::milliseconds command_timeout)
    : registry_(registry),
      gate_(gate),
      bus_(bus),
      command_timeout_(command_timeout),
      timer_("device-poll") {}

DeviceMonitor::~DeviceMonitor() {
    stop_monitoring();
}

void DeviceMonitor::start_monitoring(std::chrono::milliseconds interval) {
    stop_monitoring();
    spdlog::info("[DeviceMonitor] Polling every {}ms", interval.count());
    timer_.start(interval, [this]() { poll_once(); }, true);
}

void DeviceMonitor::stop_monitoring() {
    if (timer_.running()) {
        timer_.stop();
        spdlog::info("[DeviceMonitor] Stopped");
    }
}

bool DeviceMonitor::poll_once() {
    if (polling_.exchange(true)) {
        spdlog::debug("[DeviceMonitor] Poll already in flight, skipping");
        return false;
    }
    PollGuard guard(polling_);

    auto devices = unique_by_id(query_backends());

    std::vector<Device> previous;
    {
        std::lock_guard lock(mutex_);
        previous = current_;
        current_ = devices;
    }

    auto diff = diff_devices(previous, devices);
    if (diff.empty()) {
        return true;
    }

    for (const auto& device : diff.connected) {
        bus_.emit(events::DeviceConnectedEvent{device});
    }
    for (const auto& device : diff.disconnected) {
        bus_.emit(events::DeviceDisconnectedEvent{device});
    }
    bus_.emit(events::DevicesChangedEvent{std::move(devices)});
    return true;
}

std::vector<Device> DeviceMonitor::current_devices() const {
    std::lock_guard lock(mutex_);
    return current_;
}

std::vector<Device> DeviceMonitor::query_backends() {
    std::vector<Device> all;
    for (const auto& backend : registry_.all()) {
        auto result = gate_.run_exclusive(backend->backend_id(), command_timeout_,
            [&backend](const core::Deadline& deadline) { return backend->list_devices(deadline); });

        if (result.is_error()) {
            spdlog::warn("[DeviceMonitor] {} returned no devices this cycle: {}",
                         backend->backend_id(), result.error().describe());
            continue;
        }
        auto& found = result.value();
        all.insert(all.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    }
    return all;
}

} // namespace qadt::device
