#pragma once

#include "core/Error.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace mcp_host {

/**
 * @brief What to launch and where its stderr goes
 */
struct SpawnSpec {
    std::filesystem::path executable;   // Already resolved, passed to execv
    std::string argv0;                  // Command as the user wrote it
    std::vector<std::string> args;
    std::optional<std::filesystem::path> working_directory;
    std::filesystem::path stderr_log;   // Truncated on spawn
};

/**
 * @brief Live child process with pipes to its stdin and stdout
 *
 * Owns the pid and both pipe ends. Arguments are passed straight to execv,
 * never through a shell. Liveness is polled with waitpid(WNOHANG); the exit
 * status is cached once reaped. Destroying a still-running process kills and
 * reaps it.
 */
class AgentProcess {
public:
    ~AgentProcess();

    AgentProcess(const AgentProcess&) = delete;
    AgentProcess& operator=(const AgentProcess&) = delete;

    /**
     * @brief fork/exec the child
     *
     * Exec failures in the child are reported back through a close-on-exec
     * status pipe, so a bad binary fails here rather than as an early exit.
     */
    static Result<std::unique_ptr<AgentProcess>> spawn(const SpawnSpec& spec);

    pid_t pid() const { return pid_; }

    /**
     * @brief Non-blocking liveness check, reaps the child if it has exited
     */
    bool is_running();

    /**
     * @brief Exit code once reaped: status for a normal exit, -signal otherwise
     */
    std::optional<int> exit_code();

    /**
     * @brief Poll until the child exits or timeout elapses
     * @return true if the child has exited
     */
    bool wait_for_exit(std::chrono::milliseconds timeout);

    bool send_signal(int signal);

    /**
     * @brief Write line plus '\n' to the child's stdin
     */
    Result<void> write_line(const std::string& line);

    /**
     * @brief Read one '\n'-terminated line from the child's stdout
     *
     * Bytes after the newline stay buffered for the next call. On timeout
     * the stream is left open.
     */
    Result<std::string> read_line(std::chrono::milliseconds timeout);

    /**
     * @brief Serializes request/response exchanges on this process
     */
    std::mutex& io_mutex() { return io_mutex_; }

private:
    AgentProcess(pid_t pid, int stdin_fd, int stdout_fd);

    void reap_locked(bool block);

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    std::string read_buffer_;

    std::mutex state_mutex_;
    bool exited_ = false;
    std::optional<int> exit_code_;

    std::mutex io_mutex_;
};

} // namespace mcp_host
