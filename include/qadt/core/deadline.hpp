#pragma once

#include <algorithm>
#include <chrono>

namespace qadt::core {

/**
 * @brief Absolute point in time by which a device operation must finish
 *
 * Handed from the transport gate to the backend, and from the backend to
 * every command it runs. A default constructed deadline never expires.
 */
class Deadline {
public:
    using clock = std::chrono::steady_clock;

    Deadline() = default;

    static Deadline after(std::chrono::milliseconds budget) {
        Deadline d;
        d.at_ = clock::now() + budget;
        d.bounded_ = true;
        return d;
    }

    static Deadline none() { return Deadline{}; }

    [[nodiscard]] bool bounded() const noexcept { return bounded_; }

    [[nodiscard]] bool expired() const {
        return bounded_ && clock::now() >= at_;
    }

    [[nodiscard]] std::chrono::milliseconds remaining() const {
        if (!bounded_) {
            return std::chrono::milliseconds::max();
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(at_ - clock::now());
        return std::max(left, std::chrono::milliseconds{0});
    }

    // Smaller of the caller's own timeout and what is left of this deadline
    [[nodiscard]] std::chrono::milliseconds clamp(std::chrono::milliseconds timeout) const {
        return std::min(timeout, remaining());
    }

    [[nodiscard]] clock::time_point time_point() const noexcept { return at_; }

private:
    clock::time_point at_{};
    bool bounded_ = false;
};

} // namespace qadt::core
