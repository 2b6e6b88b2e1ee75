#pragma once

#include "qadt/core/deadline.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace qadt::process {

class ProcessSupervisor;

// Resolve program the way execvp would: as given if it contains '/', else on PATH
std::optional<std::filesystem::path> find_executable(const std::string& program);

struct CommandResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
    bool spawn_failed = false;

    [[nodiscard]] bool success() const noexcept {
        return !spawn_failed && !timed_out && exit_code == 0;
    }

    // stderr if it has anything to say, stdout otherwise
    [[nodiscard]] std::string diagnostic() const;
};

/**
 * @brief Runs short external commands with a hard timeout
 *
 * Both pipes are drained concurrently so a chatty stderr cannot stall the
 * child. On timeout the child's process group is SIGKILLed and the result
 * reports timed_out. Every child is tracked by the supervisor, if any.
 */
class CommandRunner {
public:
    explicit CommandRunner(ProcessSupervisor* supervisor = nullptr,
                           std::chrono::milliseconds default_timeout = std::chrono::milliseconds(10000));

    /**
     * @param timeout Own budget of this command
     * @param deadline Outer deadline (usually from the transport gate); the
     *        effective timeout is the smaller of the two
     */
    CommandResult run(const std::string& program,
                      const std::vector<std::string>& args,
                      std::chrono::milliseconds timeout,
                      const core::Deadline& deadline = core::Deadline::none()) const;

    CommandResult run(const std::string& program,
                      const std::vector<std::string>& args,
                      const core::Deadline& deadline = core::Deadline::none()) const {
        return run(program, args, default_timeout_, deadline);
    }

    [[nodiscard]] ProcessSupervisor* supervisor() const noexcept { return supervisor_; }
    [[nodiscard]] std::chrono::milliseconds default_timeout() const noexcept { return default_timeout_; }

private:
    ProcessSupervisor* supervisor_;
    std::chrono::milliseconds default_timeout_;
};

} // namespace qadt::process
