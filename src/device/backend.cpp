#include "qadt/device/backend.hpp"

#include <algorithm>

namespace qadt::device {

void BackendRegistry::add(BackendPtr backend) {
    if (!backend) {
        return;
    }
    auto it = std::find_if(backends_.begin(), backends_.end(),
                           [&](const BackendPtr& b) { return b->platform() == backend->platform(); });
    if (it != backends_.end()) {
        *it = std::move(backend);
    } else {
        backends_.push_back(std::move(backend));
    }
}

BackendPtr BackendRegistry::find(PlatformKind kind) const {
    auto it = std::find_if(backends_.begin(), backends_.end(),
                           [kind](const BackendPtr& b) { return b->platform() == kind; });
    return it != backends_.end() ? *it : nullptr;
}

} // namespace qadt::device
