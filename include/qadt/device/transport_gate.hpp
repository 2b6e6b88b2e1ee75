#pragma once

#include "qadt/core/deadline.hpp"
#include "qadt/core/result.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace qadt::device {

/**
 * @brief Serializes every command sent over one backend's shared transport
 *
 * WHY:
 * A debug-bridge daemon serves all devices of its kind. Concurrent commands
 * can corrupt its state or report devices offline, so each transport gets
 * one lock. Different transports run independently.
 *
 * SEMANTICS of run_exclusive(id, timeout, op):
 * - Waits at most timeout for the lock, else a Timeout error
 * - Calls op(deadline) on the calling thread, with deadline = now + timeout
 *   from the moment the lock is held; op passes it to the commands it runs,
 *   and CommandRunner kills any command still running at the deadline
 * - An op that finishes past its deadline yields a Timeout error
 * - An exception from op becomes a Transport error
 * - The lock is released on every path
 */
class TransportGate {
public:
    TransportGate() = default;

    TransportGate(const TransportGate&) = delete;
    TransportGate& operator=(const TransportGate&) = delete;

    template<typename Op>
    auto run_exclusive(const std::string& backend_id, std::chrono::milliseconds timeout, Op&& op)
        -> Result<std::invoke_result_t<Op&, const core::Deadline&>> {
        using T = std::invoke_result_t<Op&, const core::Deadline&>;

        std::unique_lock<std::timed_mutex> lock(channel(backend_id), std::defer_lock);
        if (!lock.try_lock_for(timeout)) {
            spdlog::warn("[TransportGate] {} busy for more than {}ms", backend_id, timeout.count());
            return Err<T>(ErrorKind::Timeout, "Transport " + backend_id + " busy");
        }

        const auto deadline = core::Deadline::after(timeout);
        try {
            if constexpr (std::is_void_v<T>) {
                op(deadline);
                if (deadline.expired()) {
                    return overran<T>(backend_id, timeout);
                }
                return Ok();
            } else {
                T value = op(deadline);
                if (deadline.expired()) {
                    return overran<T>(backend_id, timeout);
                }
                return Ok(std::move(value));
            }
        } catch (const std::exception& e) {
            spdlog::error("[TransportGate] {} operation failed: {}", backend_id, e.what());
            return Err<T>(ErrorKind::Transport, backend_id + ": " + e.what());
        }
    }

    // Transports that have been used at least once
    [[nodiscard]] std::size_t channel_count() const;

private:
    template<typename T>
    static Result<T> overran(const std::string& backend_id, std::chrono::milliseconds timeout) {
        spdlog::warn("[TransportGate] {} operation exceeded {}ms", backend_id, timeout.count());
        return Err<T>(ErrorKind::Timeout, "Operation on " + backend_id + " timed out");
    }

    std::timed_mutex& channel(const std::string& backend_id);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::timed_mutex>> channels_;
};

} // namespace qadt::device
