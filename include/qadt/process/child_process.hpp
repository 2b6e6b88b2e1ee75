#pragma once

#include "qadt/core/result.hpp"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace qadt::process {

/**
 * @brief RAII handle over one forked/exec'd child with piped stdout and stderr
 *
 * WHAT IT DOES:
 * - Runs the child in its own process group so the whole tree can be signalled
 * - Line-buffered blocking reads from stdout and stderr, one reader per stream
 * - close_output() wakes both readers and closes the parent's read ends; the
 *   child sees SIGPIPE on its next write
 * - Exit is reaped exactly once, under a lock, and reported to exit observers
 *
 * Destroying a handle whose child is still running kills the process group
 * and reaps it.
 */
class ChildProcess {
public:
    using ExitObserver = std::function<void(pid_t pid, int exit_code)>;

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * @brief Fork and exec program (looked up on PATH) with args
     *
     * RETURNS: a running child, or a ProcessSpawn error when pipes, fork or
     * exec fail. exec failure is detected synchronously.
     */
    static Result<std::shared_ptr<ChildProcess>> spawn(const std::string& program,
                                                       const std::vector<std::string>& args);

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] const std::string& program() const noexcept { return program_; }

    /**
     * @brief Read the next line (without the trailing newline)
     *
     * Blocks until a full line, EOF or close_output(). A final unterminated
     * line is returned at EOF. Returns false at EOF or after close_output().
     * At most one thread may read each stream.
     */
    bool read_stdout_line(std::string& line);
    bool read_stderr_line(std::string& line);

    void close_output();
    [[nodiscard]] bool output_closed() const noexcept { return output_closed_.load(); }

    Result<void> terminate();   ///< SIGTERM to the child only
    Result<void> kill();        ///< SIGKILL to the child only
    Result<void> kill_tree();   ///< SIGKILL to the child's process group

    /**
     * @brief Wait up to timeout for the child to exit, reaping it
     * @return true once the child has exited
     */
    bool wait_for_exit(std::chrono::milliseconds timeout);

    [[nodiscard]] bool running();
    [[nodiscard]] std::optional<int> exit_code() const;

    /**
     * @brief Register a callback for the child's exit
     *
     * Invoked once, on whichever thread reaps the child; immediately if the
     * child has already been reaped.
     */
    void on_exit(ExitObserver observer);

private:
    struct Stream {
        std::mutex mutex;
        int fd = -1;
        std::string buffer;
        bool eof = false;
    };

    ChildProcess(pid_t pid, std::string program, int stdout_fd, int stderr_fd, int wake_read, int wake_write);

    bool read_line(Stream& stream, std::string& line);
    bool try_reap();
    Result<void> send_signal(pid_t target, int signal, const char* what);

    const pid_t pid_;
    const std::string program_;

    Stream stdout_;
    Stream stderr_;
    int wake_read_ = -1;
    int wake_write_ = -1;
    std::atomic<bool> output_closed_{false};

    mutable std::mutex exit_mutex_;
    bool exited_ = false;
    std::optional<int> exit_code_;
    std::vector<ExitObserver> exit_observers_;
};

using ProcessPtr = std::shared_ptr<ChildProcess>;

} // namespace qadt::process
