#pragma once

#include "qadt/device/types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace qadt::session {

enum class SessionStatus {
    Idle,
    Capturing,
    Stopped
};

inline const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::Idle: return "idle";
        case SessionStatus::Capturing: return "capturing";
        case SessionStatus::Stopped: return "stopped";
    }
    return "unknown";
}

/**
 * @brief Consistent point-in-time view of a capture session
 */
struct SessionInfo {
    std::string session_id;
    std::string device_id;
    std::string device_name;
    device::PlatformKind platform = device::PlatformKind::Android;
    SessionStatus status = SessionStatus::Idle;
    std::optional<std::chrono::system_clock::time_point> start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;
    std::filesystem::path log_file_path;
    std::filesystem::path session_directory;
    std::size_t line_count = 0;
};

} // namespace qadt::session
