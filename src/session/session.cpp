#include "qadt/session/session.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace qadt::session {

CaptureSession::CaptureSession(SessionInfo initial)
    : session_id_(std::move(initial.session_id)),
      device_id_(std::move(initial.device_id)),
      device_name_(std::move(initial.device_name)),
      platform_(initial.platform),
      log_file_path_(std::move(initial.log_file_path)),
      session_directory_(std::move(initial.session_directory)),
      status_(SessionStatus::Idle),
      line_count_(initial.line_count) {}

std::shared_ptr<CaptureSession> CaptureSession::restore(SessionInfo info) {
    auto status = info.status;
    auto start = info.start_time;
    auto end = info.end_time;
    auto session = std::make_shared<CaptureSession>(std::move(info));
    session->status_ = status;
    session->start_time_ = start;
    session->end_time_ = end;
    return session;
}

std::string CaptureSession::generate_id() {
    static std::mutex rng_mutex;
    static std::mt19937 rng{std::random_device{}()};

    std::uint32_t value = 0;
    {
        std::lock_guard lock(rng_mutex);
        value = static_cast<std::uint32_t>(rng());
    }
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << value;
    return oss.str();
}

bool CaptureSession::can_transition(SessionStatus from, SessionStatus to) noexcept {
    if (from == to) {
        return true;
    }
    return (from == SessionStatus::Idle && to == SessionStatus::Capturing) ||
           (from == SessionStatus::Capturing && to == SessionStatus::Stopped);
}

SessionStatus CaptureSession::status() const {
    std::lock_guard lock(mutex_);
    return status_;
}

std::optional<std::chrono::system_clock::time_point> CaptureSession::start_time() const {
    std::lock_guard lock(mutex_);
    return start_time_;
}

std::optional<std::chrono::system_clock::time_point> CaptureSession::end_time() const {
    std::lock_guard lock(mutex_);
    return end_time_;
}

SessionInfo CaptureSession::info() const {
    SessionInfo info;
    info.session_id = session_id_;
    info.device_id = device_id_;
    info.device_name = device_name_;
    info.platform = platform_;
    info.log_file_path = log_file_path_;
    info.session_directory = session_directory_;
    info.line_count = line_count_.load();

    std::lock_guard lock(mutex_);
    info.status = status_;
    info.start_time = start_time_;
    info.end_time = end_time_;
    return info;
}

qadt::Result<void> CaptureSession::mark_capturing(std::chrono::system_clock::time_point at) {
    std::lock_guard lock(mutex_);
    if (status_ == SessionStatus::Capturing || !can_transition(status_, SessionStatus::Capturing)) {
        return qadt::Err<void>(ErrorKind::StaleState,
                               "Session " + session_id_ + " is already " + session_status_name(status_));
    }
    status_ = SessionStatus::Capturing;
    start_time_ = at;
    return qadt::Ok();
}

qadt::Result<void> CaptureSession::mark_stopped(std::chrono::system_clock::time_point at) {
    std::lock_guard lock(mutex_);
    if (status_ == SessionStatus::Stopped || !can_transition(status_, SessionStatus::Stopped)) {
        return qadt::Err<void>(ErrorKind::StaleState,
                               "Session " + session_id_ + " is not capturing");
    }
    status_ = SessionStatus::Stopped;
    end_time_ = at;
    return qadt::Ok();
}

} // namespace qadt::session
