#include "qadt/process/command_runner.hpp"

#include "qadt/process/child_process.hpp"
#include "qadt/process/supervisor.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

#include <algorithm>
#include <condition_variable>
#include <cstdlib>
#include <mutex>
#include <thread>

namespace qadt::process {
namespace {

constexpr auto kDrainGrace = std::chrono::milliseconds(200);

// Counts reader threads that reached EOF
struct DrainLatch {
    std::mutex mutex;
    std::condition_variable cv;
    int finished = 0;

    void arrive() {
        {
            std::lock_guard lock(mutex);
            ++finished;
        }
        cv.notify_all();
    }

    bool wait_until(std::chrono::steady_clock::time_point until, int expected) {
        std::unique_lock lock(mutex);
        return cv.wait_until(lock, until, [&] { return finished >= expected; });
    }
};

} // namespace

std::optional<std::filesystem::path> find_executable(const std::string& program) {
    if (program.empty()) {
        return std::nullopt;
    }
    if (program.find('/') != std::string::npos) {
        if (::access(program.c_str(), X_OK) == 0) {
            return std::filesystem::path(program);
        }
        return std::nullopt;
    }

    const char* env = std::getenv("PATH");
    const std::string path = env != nullptr ? env : "/usr/bin:/bin";
    std::size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find(':', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::filesystem::path dir = path.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }
        const auto candidate = dir / program;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

std::string CommandResult::diagnostic() const {
    auto trimmed = [](const std::string& text) {
        const auto first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return std::string{};
        }
        const auto last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    };
    std::string err = trimmed(stderr_text);
    if (!err.empty()) {
        return err;
    }
    if (timed_out) {
        return "timed out";
    }
    return trimmed(stdout_text);
}

CommandRunner::CommandRunner(ProcessSupervisor* supervisor, std::chrono::milliseconds default_timeout)
    : supervisor_(supervisor), default_timeout_(default_timeout) {}

CommandResult CommandRunner::run(const std::string& program,
                                 const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout,
                                 const core::Deadline& deadline) const {
    CommandResult result;
    const auto effective = deadline.clamp(timeout);
    const auto started = std::chrono::steady_clock::now();

    if (deadline.expired()) {
        result.timed_out = true;
        return result;
    }

    auto spawned = ChildProcess::spawn(program, args);
    if (spawned.is_error()) {
        result.spawn_failed = true;
        result.stderr_text = spawned.error().message;
        spdlog::debug("[Command] {}", spawned.error().describe());
        return result;
    }
    auto child = spawned.value();
    if (supervisor_ != nullptr) {
        supervisor_->track(child);
    }

    DrainLatch latch;
    std::thread out_reader([&]() {
        std::string line;
        while (child->read_stdout_line(line)) {
            result.stdout_text += line;
            result.stdout_text += '\n';
        }
        latch.arrive();
    });
    std::thread err_reader([&]() {
        std::string line;
        while (child->read_stderr_line(line)) {
            result.stderr_text += line;
            result.stderr_text += '\n';
        }
        latch.arrive();
    });

    if (!child->wait_for_exit(effective)) {
        result.timed_out = true;
        auto killed = child->kill_tree();
        if (killed.is_error()) {
            spdlog::warn("[Command] {}", killed.error().message);
        }
        child->close_output();
        child->wait_for_exit(kDrainGrace);
        spdlog::warn("[Command] {} timed out after {}ms", program, effective.count());
    } else {
        // A grandchild can keep the pipes open after the child itself exited
        const auto until = std::max(started + effective, std::chrono::steady_clock::now() + kDrainGrace);
        if (!latch.wait_until(until, 2)) {
            child->close_output();
        }
    }

    out_reader.join();
    err_reader.join();

    result.exit_code = child->exit_code().value_or(-1);
    return result;
}

} // namespace qadt::process
