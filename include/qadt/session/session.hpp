#pragma once

#include "qadt/core/result.hpp"
#include "qadt/session/types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace qadt::session {

class SessionManager;

/**
 * @brief One logging run for one device
 *
 * Shared between the manager, the auto-capture policy and any consumer.
 * Identity fields are fixed at construction; status, times and line count
 * are changed only by SessionManager.
 *
 * Transitions: Idle -> Capturing -> Stopped. Stopped is terminal and a
 * transition to the current state is a no-op.
 */
class CaptureSession {
public:
    explicit CaptureSession(SessionInfo initial);

    // Rebuild a finished session found on disk
    static std::shared_ptr<CaptureSession> restore(SessionInfo info);

    // 8 lowercase hex characters
    static std::string generate_id();

    [[nodiscard]] static bool can_transition(SessionStatus from, SessionStatus to) noexcept;

    [[nodiscard]] const std::string& session_id() const noexcept { return session_id_; }
    [[nodiscard]] const std::string& device_id() const noexcept { return device_id_; }
    [[nodiscard]] const std::string& device_name() const noexcept { return device_name_; }
    [[nodiscard]] device::PlatformKind platform() const noexcept { return platform_; }
    [[nodiscard]] const std::filesystem::path& log_file_path() const noexcept { return log_file_path_; }
    [[nodiscard]] const std::filesystem::path& session_directory() const noexcept { return session_directory_; }

    [[nodiscard]] SessionStatus status() const;
    [[nodiscard]] std::size_t line_count() const noexcept { return line_count_.load(); }
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> start_time() const;
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> end_time() const;
    [[nodiscard]] SessionInfo info() const;

private:
    friend class SessionManager;

    qadt::Result<void> mark_capturing(std::chrono::system_clock::time_point at);
    qadt::Result<void> mark_stopped(std::chrono::system_clock::time_point at);
    void add_lines(std::size_t count) noexcept { line_count_ += count; }

    const std::string session_id_;
    const std::string device_id_;
    const std::string device_name_;
    const device::PlatformKind platform_;
    const std::filesystem::path log_file_path_;
    const std::filesystem::path session_directory_;

    mutable std::mutex mutex_;
    SessionStatus status_;
    std::optional<std::chrono::system_clock::time_point> start_time_;
    std::optional<std::chrono::system_clock::time_point> end_time_;
    std::atomic<std::size_t> line_count_;
};

using SessionPtr = std::shared_ptr<CaptureSession>;

} // namespace qadt::session
