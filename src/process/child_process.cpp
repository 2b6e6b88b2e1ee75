#include "qadt/process/child_process.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace qadt::process {
namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string errno_text(int err) {
    return std::strerror(err);
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void strip_carriage_return(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // namespace

Result<std::shared_ptr<ChildProcess>> ChildProcess::spawn(const std::string& program,
                                                          const std::vector<std::string>& args) {
    using Ptr = std::shared_ptr<ChildProcess>;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int wake_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        for (int* p : {out_pipe, err_pipe, wake_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(wake_pipe, O_CLOEXEC) != 0 || ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        const int err = errno;
        close_all();
        return Err<Ptr>(ErrorKind::ProcessSpawn, "pipe failed: " + errno_text(err));
    }

    // argv must be built before fork; the child may only make async-signal-safe calls
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        close_all();
        return Err<Ptr>(ErrorKind::ProcessSpawn, "fork failed: " + errno_text(err));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);

        const int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        ::execvp(program.c_str(), argv.data());

        const int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Also set from the parent so signalling the group cannot race the child's setpgid
    ::setpgid(pid, pid);

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n > 0) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_all();
        return Err<Ptr>(ErrorKind::ProcessSpawn,
                        "exec " + program + " failed: " + errno_text(exec_errno));
    }

    Ptr child(new ChildProcess(pid, program, out_pipe[0], err_pipe[0], wake_pipe[0], wake_pipe[1]));
    spdlog::debug("[Process] Spawned {} pid={}", program, pid);
    return Ok(std::move(child));
}

ChildProcess::ChildProcess(pid_t pid, std::string program, int stdout_fd, int stderr_fd,
                           int wake_read, int wake_write)
    : pid_(pid),
      program_(std::move(program)),
      wake_read_(wake_read),
      wake_write_(wake_write) {
    stdout_.fd = stdout_fd;
    stderr_.fd = stderr_fd;
}

ChildProcess::~ChildProcess() {
    if (!try_reap()) {
        auto killed = kill_tree();
        if (killed.is_error()) {
            spdlog::warn("[Process] {} pid={}: {}", program_, pid_, killed.error().message);
        }
        std::lock_guard lock(exit_mutex_);
        if (!exited_) {
            int status = 0;
            pid_t r = 0;
            do {
                r = ::waitpid(pid_, &status, 0);
            } while (r < 0 && errno == EINTR);
            exited_ = true;
            exit_code_ = r == pid_ ? decode_status(status) : -1;
        }
    }

    close_fd(stdout_.fd);
    close_fd(stderr_.fd);
    close_fd(wake_read_);
    close_fd(wake_write_);
}

bool ChildProcess::read_stdout_line(std::string& line) {
    return read_line(stdout_, line);
}

bool ChildProcess::read_stderr_line(std::string& line) {
    return read_line(stderr_, line);
}

bool ChildProcess::read_line(Stream& stream, std::string& line) {
    while (true) {
        int fd = -1;
        {
            std::lock_guard lock(stream.mutex);
            if (output_closed_ || stream.fd < 0) {
                return false;
            }
            auto pos = stream.buffer.find('\n');
            if (pos != std::string::npos) {
                line.assign(stream.buffer, 0, pos);
                stream.buffer.erase(0, pos + 1);
                strip_carriage_return(line);
                return true;
            }
            if (stream.eof) {
                if (stream.buffer.empty()) {
                    return false;
                }
                line = std::move(stream.buffer);
                stream.buffer.clear();
                strip_carriage_return(line);
                return true;
            }
            fd = stream.fd;
        }

        pollfd fds[2] = {{fd, POLLIN, 0}, {wake_read_, POLLIN, 0}};
        const int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }

        // The wake pipe stays readable once close_output() has run
        std::lock_guard lock(stream.mutex);
        if (output_closed_ || stream.fd < 0) {
            return false;
        }
        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) {
            char chunk[4096];
            const ssize_t n = ::read(stream.fd, chunk, sizeof(chunk));
            if (n > 0) {
                stream.buffer.append(chunk, static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                stream.eof = true;
            }
        }
    }
}

void ChildProcess::close_output() {
    if (output_closed_.exchange(true)) {
        return;
    }

    const char byte = 'x';
    ssize_t ignored = ::write(wake_write_, &byte, 1);
    (void)ignored;

    for (Stream* stream : {&stdout_, &stderr_}) {
        std::lock_guard lock(stream->mutex);
        close_fd(stream->fd);
    }
}

Result<void> ChildProcess::send_signal(pid_t target, int signal, const char* what) {
    {
        // A reaped pid may already belong to another process
        std::lock_guard lock(exit_mutex_);
        if (exited_) {
            return Ok();
        }
    }
    if (::kill(target, signal) != 0) {
        const int err = errno;
        if (err == ESRCH) {
            return Ok();
        }
        return Err<void>(ErrorKind::Io, std::string(what) + " " + std::to_string(pid_) + " failed: " + errno_text(err));
    }
    return Ok();
}

Result<void> ChildProcess::terminate() {
    return send_signal(pid_, SIGTERM, "SIGTERM");
}

Result<void> ChildProcess::kill() {
    return send_signal(pid_, SIGKILL, "SIGKILL");
}

Result<void> ChildProcess::kill_tree() {
    return send_signal(-pid_, SIGKILL, "SIGKILL group");
}

bool ChildProcess::try_reap() {
    std::vector<ExitObserver> observers;
    int code = -1;
    {
        std::lock_guard lock(exit_mutex_);
        if (exited_) {
            return true;
        }
        int status = 0;
        const pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == 0 || (r < 0 && errno == EINTR)) {
            return false;
        }
        exited_ = true;
        exit_code_ = r == pid_ ? decode_status(status) : -1;
        code = *exit_code_;
        observers.swap(exit_observers_);
    }

    spdlog::debug("[Process] {} pid={} exited with {}", program_, pid_, code);
    for (auto& observer : observers) {
        observer(pid_, code);
    }
    return true;
}

bool ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    constexpr auto kPollStep = std::chrono::milliseconds(10);
    // Treat anything longer than a year as "wait forever"
    const bool unbounded = timeout >= std::chrono::hours(24 * 365);
    const auto deadline = std::chrono::steady_clock::now() + (unbounded ? std::chrono::milliseconds(0) : timeout);

    while (!try_reap()) {
        const auto now = std::chrono::steady_clock::now();
        if (unbounded) {
            std::this_thread::sleep_for(kPollStep);
            continue;
        }
        if (now >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kPollStep, deadline - now));
    }
    return true;
}

bool ChildProcess::running() {
    return !try_reap();
}

std::optional<int> ChildProcess::exit_code() const {
    std::lock_guard lock(exit_mutex_);
    return exit_code_;
}

void ChildProcess::on_exit(ExitObserver observer) {
    int code = -1;
    {
        std::lock_guard lock(exit_mutex_);
        if (!exited_) {
            exit_observers_.push_back(std::move(observer));
            return;
        }
        code = exit_code_.value_or(-1);
    }
    observer(pid_, code);
}

} // namespace qadt::process
