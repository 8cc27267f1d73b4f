#pragma once

#include "core/Error.hpp"
#include "process/AgentProcess.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace mcp_host {

using json = nlohmann::json;
using ServerId = std::int64_t;

/**
 * @brief Timing and placement knobs for supervised processes
 */
struct SupervisorOptions {
    std::filesystem::path logs_dir = "logs";
    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds min_stable_time{1000};
    std::chrono::milliseconds max_stabilization{3000};
    std::chrono::milliseconds graceful_timeout{10000};
    std::chrono::milliseconds kill_timeout{5000};
};

enum class ProcessStatus {
    NotFound,
    Running,
    Exited
};

const char* to_string(ProcessStatus status);

/**
 * @brief Point-in-time view of one supervised process
 */
struct ProcessHealth {
    ProcessStatus status = ProcessStatus::NotFound;
    std::optional<pid_t> pid;
    std::optional<int> exit_code;   // Only when exited
    std::string name;
    std::string command;
    std::filesystem::path log_file;
    std::filesystem::path error_log_file;

    bool running() const { return status == ProcessStatus::Running; }
};

void to_json(json& j, const ProcessHealth& health);

/**
 * @brief Registration of one local agent: spawn descriptor, OS process and logs
 */
struct AgentProcessHandle {
    ServerId id = 0;
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> working_directory;
    std::filesystem::path log_file;        // Launch diagnostics
    std::filesystem::path error_log_file;  // Child stderr
    std::unique_ptr<AgentProcess> process;
    std::shared_ptr<spdlog::logger> launch_log;
};

/**
 * @brief Owns the lifecycle of local agent processes
 *
 * The live table maps server id to handle; only the supervisor mutates it.
 * A process that dies on its own is noticed lazily, on the next health
 * query or cleanup. Callers must serialize start/stop/health for the same id.
 */
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(SupervisorOptions options = {});

    /**
     * @brief Stops every registered process
     */
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /**
     * @brief True iff command resolves to an executable file
     */
    static bool validate_command(const std::string& command);

    /**
     * @brief Spawn and register an agent, then wait for it to stabilize
     *
     * Fails without spawning when the command does not resolve. A process
     * that exits within the stabilization window is deregistered and the
     * failure carries its exit code.
     */
    Result<void> start(ServerId id,
                       const std::string& name,
                       const std::string& command,
                       const std::vector<std::string>& args,
                       const std::optional<std::filesystem::path>& working_directory = std::nullopt);

    /**
     * @brief SIGTERM, wait, SIGKILL, wait; deregister on success
     *
     * Unknown ids succeed as a no-op. Fails only if the process survives
     * the kill window, in which case it stays registered.
     */
    Result<void> stop(ServerId id);

    bool is_running(ServerId id) const;

    ProcessHealth health(ServerId id) const;

    /**
     * @brief "stopped" if unregistered, "running" if alive, "error" if exited
     */
    std::string status(ServerId id) const;

    std::vector<ServerId> running_servers() const;

    std::map<ServerId, ProcessHealth> all_health() const;

    /**
     * @brief Deregister every handle whose process has exited
     * @return Final health of each removed handle
     */
    std::map<ServerId, ProcessHealth> reap_dead_processes();

    std::size_t cleanup_dead_processes() { return reap_dead_processes().size(); }

    /**
     * @brief stop() every registered id, logging failures
     */
    void shutdown_all();

    /**
     * @brief Registered handle for protocol traffic, or nullptr
     */
    std::shared_ptr<AgentProcessHandle> find(ServerId id) const;

    const SupervisorOptions& options() const { return options_; }

private:
    static ProcessHealth snapshot(const AgentProcessHandle& handle);

    void deregister(ServerId id, const std::shared_ptr<AgentProcessHandle>& handle);

    SupervisorOptions options_;
    mutable std::mutex table_mutex_;
    std::map<ServerId, std::shared_ptr<AgentProcessHandle>> processes_;
};

} // namespace mcp_host
