#include "AgentProcess.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <system_error>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcp_host {

namespace {

std::string os_error_text(int err) {
    return std::system_category().message(err);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

// Runs in the forked child: only async-signal-safe calls from here on
[[noreturn]] void report_child_failure(int status_fd) {
    int err = errno;
    ssize_t written = ::write(status_fd, &err, sizeof(err));
    static_cast<void>(written);
    ::_exit(127);
}

} // namespace

AgentProcess::AgentProcess(pid_t pid, int stdin_fd, int stdout_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd) {}

AgentProcess::~AgentProcess() {
    // Closing stdin first lets a well-behaved agent see EOF
    close_fd(stdin_fd_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!exited_) {
            reap_locked(false);
        }
        if (!exited_) {
            spdlog::warn("Killing agent process {} on handle destruction", pid_);
            ::kill(pid_, SIGKILL);
            reap_locked(true);
        }
    }
    close_fd(stdout_fd_);
}

Result<std::unique_ptr<AgentProcess>> AgentProcess::spawn(const SpawnSpec& spec) {
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        close_fd(stdin_pipe[0]);
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(status_pipe[0]);
        close_fd(status_pipe[1]);
    };

    if (::pipe2(stdin_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_all();
        return Error{ErrorCode::SpawnFailure, "Failed to create pipes: " + os_error_text(err)};
    }

    int stderr_fd = ::open(spec.stderr_log.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (stderr_fd < 0) {
        int err = errno;
        close_all();
        return Error{ErrorCode::SpawnFailure,
            "Cannot open error log " + spec.stderr_log.string() + ": " + os_error_text(err)};
    }

    // Everything the child touches is prepared before fork
    const std::string exec_path = spec.executable.string();
    const std::string cwd = spec.working_directory ? spec.working_directory->string() : std::string();
    const bool change_dir = spec.working_directory.has_value() && !cwd.empty();

    std::vector<std::string> argv_storage;
    argv_storage.reserve(spec.args.size() + 1);
    argv_storage.push_back(spec.argv0.empty() ? exec_path : spec.argv0);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(stderr_fd);
        close_all();
        return Error{ErrorCode::SpawnFailure, "fork failed: " + os_error_text(err)};
    }

    if (pid == 0) {
        // Ignored dispositions and the signal mask survive exec
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

        if (::dup2(stdin_pipe[0], STDIN_FILENO) < 0 ||
            ::dup2(stdout_pipe[1], STDOUT_FILENO) < 0 ||
            ::dup2(stderr_fd, STDERR_FILENO) < 0) {
            report_child_failure(status_pipe[1]);
        }
        if (change_dir && ::chdir(cwd.c_str()) != 0) {
            report_child_failure(status_pipe[1]);
        }
        ::execv(exec_path.c_str(), argv.data());
        report_child_failure(status_pipe[1]);
    }

    ::close(stderr_fd);
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(status_pipe[1]);

    // EOF means exec succeeded and closed the status pipe
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_all();
        std::string what = change_dir
            ? "Failed to launch " + exec_path + " in " + cwd
            : "Failed to launch " + exec_path;
        return Error{ErrorCode::SpawnFailure, what + ": " + os_error_text(child_errno)};
    }

    spdlog::debug("Spawned {} with pid {}", exec_path, pid);
    return std::unique_ptr<AgentProcess>(new AgentProcess(pid, stdin_pipe[1], stdout_pipe[0]));
}

void AgentProcess::reap_locked(bool block) {
    int status = 0;
    pid_t reaped = 0;
    do {
        reaped = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (reaped < 0 && errno == EINTR);

    if (reaped == pid_) {
        exited_ = true;
        exit_code_ = decode_wait_status(status);
    } else if (reaped < 0) {
        // ECHILD: the status was collected elsewhere, the exit code is lost
        spdlog::warn("waitpid({}) failed: {}", pid_, os_error_text(errno));
        exited_ = true;
    }
}

bool AgentProcess::is_running() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!exited_) {
        reap_locked(false);
    }
    return !exited_;
}

std::optional<int> AgentProcess::exit_code() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!exited_) {
        reap_locked(false);
    }
    return exit_code_;
}

bool AgentProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const std::chrono::milliseconds step(20);

    while (is_running()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(step, remaining));
    }
    return true;
}

bool AgentProcess::send_signal(int signal) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    // Never signal a reaped pid, it may already belong to someone else
    if (exited_) {
        return false;
    }
    return ::kill(pid_, signal) == 0;
}

Result<void> AgentProcess::write_line(const std::string& line) {
    if (stdin_fd_ < 0) {
        return Error{ErrorCode::TransportError, "Agent stdin is closed"};
    }

    std::string data = line;
    data.push_back('\n');

    std::size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Error{ErrorCode::TransportError,
                "Write to agent stdin failed: " + os_error_text(errno)};
        }
        offset += static_cast<std::size_t>(n);
    }
    return {};
}

Result<std::string> AgentProcess::read_line(std::chrono::milliseconds timeout) {
    if (stdout_fd_ < 0) {
        return Error{ErrorCode::TransportError, "Agent stdout is closed"};
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    for (;;) {
        auto newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return Error{ErrorCode::TransportTimeout,
                "No response within " + std::to_string(timeout.count()) + "ms"};
        }

        pollfd pfd{stdout_fd_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Error{ErrorCode::TransportError, "poll failed: " + os_error_text(errno)};
        }
        if (ready == 0) {
            continue;
        }

        char chunk[4096];
        ssize_t n = ::read(stdout_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return Error{ErrorCode::TransportError,
                "Read from agent stdout failed: " + os_error_text(errno)};
        }
        if (n == 0) {
            return Error{ErrorCode::TransportError, "Agent closed its output stream"};
        }
        read_buffer_.append(chunk, static_cast<std::size_t>(n));
    }
}

} // namespace mcp_host
