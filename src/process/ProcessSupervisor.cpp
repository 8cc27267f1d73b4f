#include "ProcessSupervisor.hpp"
#include "core/CommandResolver.hpp"
#include "core/Logging.hpp"
#include <csignal>
#include <sstream>
#include <system_error>
#include <thread>

namespace mcp_host {

namespace {

std::string join_args(const std::vector<std::string>& args) {
    std::ostringstream out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            out << ' ';
        }
        out << args[i];
    }
    return out.str();
}

} // namespace

const char* to_string(ProcessStatus status) {
    switch (status) {
        case ProcessStatus::NotFound: return "not_found";
        case ProcessStatus::Running: return "running";
        case ProcessStatus::Exited: return "exited";
    }
    return "not_found";
}

void to_json(json& j, const ProcessHealth& health) {
    j = json{
        {"status", to_string(health.status)},
        {"running", health.running()},
        {"pid", health.pid ? json(*health.pid) : json()},
        {"exit_code", health.exit_code ? json(*health.exit_code) : json()}
    };
    if (health.status != ProcessStatus::NotFound) {
        j["name"] = health.name;
        j["command"] = health.command;
        j["log_file"] = health.log_file.string();
        j["error_log_file"] = health.error_log_file.string();
    }
}

ProcessSupervisor::ProcessSupervisor(SupervisorOptions options)
    : options_(std::move(options)) {
    // A crashed agent must surface as EPIPE on write, not kill the controller
    std::signal(SIGPIPE, SIG_IGN);

    std::error_code ec;
    std::filesystem::create_directories(options_.logs_dir, ec);
    if (ec) {
        spdlog::warn("Cannot create logs directory {}: {}", options_.logs_dir.string(), ec.message());
    }
    spdlog::debug("ProcessSupervisor initialized, logs in {}", options_.logs_dir.string());
}

ProcessSupervisor::~ProcessSupervisor() {
    shutdown_all();
}

bool ProcessSupervisor::validate_command(const std::string& command) {
    return CommandResolver::validate(command);
}

Result<void> ProcessSupervisor::start(ServerId id,
                                      const std::string& name,
                                      const std::string& command,
                                      const std::vector<std::string>& args,
                                      const std::optional<std::filesystem::path>& working_directory) {
    spdlog::info("Starting MCP server {} (ID: {}): {} {}", name, id, command, join_args(args));

    auto executable = CommandResolver::resolve(command);
    if (!executable) {
        spdlog::error("Command not found or not executable: {}", command);
        return Error{ErrorCode::CommandNotFound, "Command not found or not executable: " + command};
    }

    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        auto existing = processes_.find(id);
        if (existing != processes_.end()) {
            if (existing->second->process->is_running()) {
                spdlog::error("MCP server {} (ID: {}) is already running", name, id);
                return Error{ErrorCode::AlreadyRunning,
                    "Server " + std::to_string(id) + " is already running"};
            }
            spdlog::debug("Replacing exited registration for server {}", id);
            processes_.erase(existing);
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.logs_dir, ec);

    auto handle = std::make_shared<AgentProcessHandle>();
    handle->id = id;
    handle->name = name;
    handle->command = command;
    handle->args = args;
    handle->working_directory = working_directory;
    handle->log_file = options_.logs_dir / (name + "-" + std::to_string(id) + ".log");
    handle->error_log_file = options_.logs_dir / (name + "-" + std::to_string(id) + "-error.log");

    try {
        handle->launch_log = make_file_logger("mcp-" + name + "-" + std::to_string(id), handle->log_file);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Cannot open launch log {}: {}", handle->log_file.string(), e.what());
        return Error{ErrorCode::SpawnFailure,
            "Cannot open launch log " + handle->log_file.string() + ": " + e.what()};
    }

    auto& launch_log = *handle->launch_log;
    launch_log.info("Launching {} (resolved to {})", command, executable->string());
    launch_log.info("Arguments: [{}]", join_args(args));
    launch_log.info("Working directory: {}",
        working_directory ? working_directory->string() : std::string("(inherited)"));

    SpawnSpec spec;
    spec.executable = *executable;
    spec.argv0 = command;
    spec.args = args;
    spec.working_directory = working_directory;
    spec.stderr_log = handle->error_log_file;

    auto spawned = AgentProcess::spawn(spec);
    if (!spawned) {
        launch_log.error("Spawn failed: {}", spawned.error().message);
        spdlog::error("Error starting MCP server {}: {}", name, spawned.error().message);
        return spawned.error();
    }
    handle->process = std::move(spawned).value();

    const pid_t pid = handle->process->pid();
    launch_log.info("Started with pid {}", pid);

    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        processes_[id] = handle;
    }

    // Many agent runtimes die within a second on bad configuration; report
    // that synchronously instead of handing back a doomed process
    auto elapsed = std::chrono::milliseconds::zero();
    while (elapsed < options_.max_stabilization) {
        std::this_thread::sleep_for(options_.poll_interval);
        elapsed += options_.poll_interval;

        if (!handle->process->is_running()) {
            break;
        }
        if (elapsed >= options_.min_stable_time) {
            break;
        }
    }

    if (!handle->process->is_running()) {
        auto exit_code = handle->process->exit_code();
        std::string code_text = exit_code ? std::to_string(*exit_code) : std::string("unknown");
        launch_log.error("Crashed during startup after {}ms, exit code {}", elapsed.count(), code_text);
        spdlog::error("MCP server {} (ID: {}) crashed during startup, exit code {}", name, id, code_text);
        deregister(id, handle);
        return Error{ErrorCode::SpawnFailure,
            "Process exited during startup, see " + handle->error_log_file.string(), exit_code};
    }

    launch_log.info("Stable after {}ms", elapsed.count());
    spdlog::info("Successfully started MCP server {} (ID: {}, pid {})", name, id, pid);
    return {};
}

Result<void> ProcessSupervisor::stop(ServerId id) {
    auto handle = find(id);
    if (!handle) {
        spdlog::info("Server {} already stopped", id);
        return {};
    }

    auto& process = *handle->process;
    auto& launch_log = *handle->launch_log;

    if (process.is_running()) {
        spdlog::info("Stopping MCP server {} (ID: {})", handle->name, id);
        launch_log.info("Sending SIGTERM");
        process.send_signal(SIGTERM);

        if (process.wait_for_exit(options_.graceful_timeout)) {
            launch_log.info("Terminated gracefully, exit code {}", process.exit_code().value_or(-1));
            spdlog::info("MCP server {} terminated gracefully", handle->name);
        } else {
            launch_log.warn("No exit after {}ms, sending SIGKILL", options_.graceful_timeout.count());
            spdlog::warn("MCP server {} did not terminate gracefully, force killing", handle->name);
            process.send_signal(SIGKILL);

            if (!process.wait_for_exit(options_.kill_timeout)) {
                launch_log.error("Still alive {}ms after SIGKILL", options_.kill_timeout.count());
                spdlog::error("Failed to force kill MCP server {}", handle->name);
                return Error{ErrorCode::StopFailed,
                    "Process " + std::to_string(process.pid()) + " survived SIGKILL"};
            }
            launch_log.info("Force killed");
            spdlog::info("MCP server {} force killed", handle->name);
        }
    } else {
        spdlog::info("MCP server {} was already stopped", handle->name);
    }

    deregister(id, handle);
    spdlog::info("Successfully stopped MCP server {} (ID: {})", handle->name, id);
    return {};
}

bool ProcessSupervisor::is_running(ServerId id) const {
    auto handle = find(id);
    return handle && handle->process->is_running();
}

ProcessHealth ProcessSupervisor::snapshot(const AgentProcessHandle& handle) {
    ProcessHealth health;
    health.pid = handle.process->pid();
    health.name = handle.name;
    health.command = handle.command;
    health.log_file = handle.log_file;
    health.error_log_file = handle.error_log_file;

    if (handle.process->is_running()) {
        health.status = ProcessStatus::Running;
    } else {
        health.status = ProcessStatus::Exited;
        health.exit_code = handle.process->exit_code();
    }
    return health;
}

ProcessHealth ProcessSupervisor::health(ServerId id) const {
    auto handle = find(id);
    if (!handle) {
        return ProcessHealth{};
    }
    return snapshot(*handle);
}

std::string ProcessSupervisor::status(ServerId id) const {
    auto handle = find(id);
    if (!handle) {
        return "stopped";
    }
    return handle->process->is_running() ? "running" : "error";
}

std::vector<ServerId> ProcessSupervisor::running_servers() const {
    std::vector<ServerId> ids;
    std::lock_guard<std::mutex> lock(table_mutex_);
    for (const auto& [id, handle] : processes_) {
        if (handle->process->is_running()) {
            ids.push_back(id);
        }
    }
    return ids;
}

std::map<ServerId, ProcessHealth> ProcessSupervisor::all_health() const {
    std::map<ServerId, ProcessHealth> result;
    std::lock_guard<std::mutex> lock(table_mutex_);
    for (const auto& [id, handle] : processes_) {
        result.emplace(id, snapshot(*handle));
    }
    return result;
}

std::map<ServerId, ProcessHealth> ProcessSupervisor::reap_dead_processes() {
    std::map<ServerId, ProcessHealth> removed;
    std::lock_guard<std::mutex> lock(table_mutex_);

    for (auto it = processes_.begin(); it != processes_.end();) {
        auto& handle = *it->second;
        if (handle.process->is_running()) {
            ++it;
            continue;
        }

        auto exit_code = handle.process->exit_code();
        spdlog::warn("Cleaning up dead process: {} (exit code: {})",
            handle.name, exit_code ? std::to_string(*exit_code) : std::string("unknown"));
        handle.launch_log->warn("Exited outside of stop, exit code {}", exit_code.value_or(-1));
        removed.emplace(it->first, snapshot(handle));
        it = processes_.erase(it);
    }

    return removed;
}

void ProcessSupervisor::shutdown_all() {
    std::vector<ServerId> ids;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        for (const auto& entry : processes_) {
            ids.push_back(entry.first);
        }
    }

    if (ids.empty()) {
        return;
    }

    spdlog::info("Shutting down {} MCP servers", ids.size());
    for (ServerId id : ids) {
        auto stopped = stop(id);
        if (!stopped) {
            spdlog::error("Failed to stop server {} during shutdown: {}", id, stopped.error().message);
        }
    }
}

std::shared_ptr<AgentProcessHandle> ProcessSupervisor::find(ServerId id) const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = processes_.find(id);
    return it == processes_.end() ? nullptr : it->second;
}

void ProcessSupervisor::deregister(ServerId id, const std::shared_ptr<AgentProcessHandle>& handle) {
    std::lock_guard<std::mutex> lock(table_mutex_);
    auto it = processes_.find(id);
    // A concurrent restart may already have replaced the entry
    if (it != processes_.end() && it->second == handle) {
        processes_.erase(it);
    }
}

} // namespace mcp_host
