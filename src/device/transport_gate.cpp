#include "qadt/device/transport_gate.hpp"

namespace qadt::device {

std::timed_mutex& TransportGate::channel(const std::string& backend_id) {
    std::lock_guard lock(mutex_);
    auto& slot = channels_[backend_id];
    if (!slot) {
        slot = std::make_unique<std::timed_mutex>();
    }
    return *slot;
}

std::size_t TransportGate::channel_count() const {
    std::lock_guard lock(mutex_);
    return channels_.size();
}

} // namespace qadt::device
