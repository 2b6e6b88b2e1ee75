#pragma once

#include "qadt/core/deadline.hpp"
#include "qadt/device/types.hpp"
#include "qadt/process/child_process.hpp"
#include "qadt/process/command_runner.hpp"
#include "qadt/process/supervisor.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <thread>

namespace qadt::backends {

/**
 * @brief Runs at most one scrcpy screen mirror for an Android device
 *
 * scrcpy's console output is drained into the debug log so the mirror never
 * blocks on a full pipe.
 */
class MirrorController {
public:
    MirrorController(std::string scrcpy, process::ProcessSupervisor* supervisor);
    ~MirrorController();

    MirrorController(const MirrorController&) = delete;
    MirrorController& operator=(const MirrorController&) = delete;

    device::ToolStatus check_availability(const core::Deadline& deadline = core::Deadline::none()) const;

    /**
     * @brief Launch `scrcpy -s <device_id>`
     *
     * Returns true immediately when a mirror is already running. Otherwise
     * true if the window process is still alive after settle.
     */
    bool start(const std::string& device_id,
               std::chrono::milliseconds settle = std::chrono::milliseconds(500));

    void stop();
    [[nodiscard]] bool running();
    [[nodiscard]] std::string device_id() const;

private:
    static void drain(process::ProcessPtr process, bool from_stderr);
    void stop_locked();

    std::string scrcpy_;
    process::ProcessSupervisor* supervisor_;
    process::CommandRunner runner_;

    mutable std::mutex mutex_;
    process::ProcessPtr process_;
    std::string device_id_;
    std::thread stdout_drain_;
    std::thread stderr_drain_;
};

} // namespace qadt::backends
