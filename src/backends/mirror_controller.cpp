#include "qadt/backends/mirror_controller.hpp"

#include "qadt/backends/parsers.hpp"

#include <spdlog/spdlog.h>

namespace qadt::backends {

MirrorController::MirrorController(std::string scrcpy, process::ProcessSupervisor* supervisor)
    : scrcpy_(std::move(scrcpy)), supervisor_(supervisor), runner_(supervisor) {}

MirrorController::~MirrorController() {
    stop();
}

device::ToolStatus MirrorController::check_availability(const core::Deadline& deadline) const {
    device::ToolStatus status;
    status.name = "scrcpy (Screen Mirror)";

    auto result = runner_.run(scrcpy_, {"--version"}, deadline);
    if (result.success()) {
        status.installed = true;
        status.version = extract_version(result.stdout_text).value_or("Installed");
        auto path = process::find_executable(scrcpy_);
        status.path = path ? path->string() : scrcpy_;
        status.message = "scrcpy is ready for screen mirroring";
    } else {
        spdlog::warn("[Mirror] scrcpy --version failed: {}", result.diagnostic());
        status.installed = false;
        status.message = "scrcpy not found. Install it or set tools.scrcpy in the settings file.";
    }
    return status;
}

bool MirrorController::start(const std::string& device_id, std::chrono::milliseconds settle) {
    std::unique_lock lock(mutex_);
    if (process_ && process_->running()) {
        return true;
    }
    stop_locked();

    auto spawned = process::ChildProcess::spawn(
        scrcpy_, {"-s", device_id, "--window-title", "QA Mirror - " + device_id});
    if (spawned.is_error()) {
        spdlog::error("[Mirror] {}", spawned.error().describe());
        return false;
    }
    process_ = spawned.value();
    device_id_ = device_id;
    if (supervisor_ != nullptr) {
        supervisor_->track(process_);
    }
    stdout_drain_ = std::thread(&MirrorController::drain, process_, false);
    stderr_drain_ = std::thread(&MirrorController::drain, process_, true);

    auto process = process_;
    lock.unlock();

    // scrcpy exits quickly when the device refuses the connection
    if (process->wait_for_exit(settle)) {
        spdlog::warn("[Mirror] scrcpy for {} exited with code {}", device_id, process->exit_code().value_or(-1));
        return false;
    }
    spdlog::info("[Mirror] Mirroring {} (pid {})", device_id, process->pid());
    return true;
}

void MirrorController::drain(process::ProcessPtr process, bool from_stderr) {
    std::string line;
    while (from_stderr ? process->read_stderr_line(line) : process->read_stdout_line(line)) {
        spdlog::debug("[Mirror] {}", line);
    }
}

void MirrorController::stop() {
    std::lock_guard lock(mutex_);
    stop_locked();
}

void MirrorController::stop_locked() {
    if (process_) {
        if (process_->running()) {
            auto killed = process_->kill_tree();
            if (killed.is_error()) {
                spdlog::warn("[Mirror] {}", killed.error().message);
            }
            if (!process_->wait_for_exit(std::chrono::milliseconds(2000))) {
                spdlog::warn("[Mirror] scrcpy pid {} did not exit", process_->pid());
            }
            spdlog::info("[Mirror] Stopped mirroring {}", device_id_);
        }
        process_->close_output();
    }
    for (std::thread* drain : {&stdout_drain_, &stderr_drain_}) {
        if (drain->joinable()) {
            drain->join();
        }
    }
    process_.reset();
    device_id_.clear();
}

bool MirrorController::running() {
    std::lock_guard lock(mutex_);
    return process_ && process_->running();
}

std::string MirrorController::device_id() const {
    std::lock_guard lock(mutex_);
    return device_id_;
}

} // namespace qadt::backends
