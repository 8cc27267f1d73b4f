#include "ServerController.hpp"
#include <spdlog/spdlog.h>

namespace mcp_host {

ServerController::ServerController(IServerStore& store, ProcessSupervisor& supervisor, ProtocolSession& session)
    : store_(store), supervisor_(supervisor), session_(session) {}

std::mutex& ServerController::server_mutex(ServerId id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = server_locks_[id];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

Result<ServerRecord> ServerController::find_record(ServerId id) const {
    auto record = store_.get_server(id);
    if (!record) {
        return Error{ErrorCode::NotFound, "Server " + std::to_string(id) + " not found"};
    }
    return *record;
}

Target ServerController::target_for(const ServerRecord& record) {
    if (record.type == ServerType::Local) {
        return LocalTarget{record.id};
    }
    return RemoteTarget{record.url, record.api_key};
}

Result<StartReport> ServerController::start_server(ServerId id) {
    auto found = find_record(id);
    if (!found) {
        return found.error();
    }
    const ServerRecord& record = found.value();
    if (record.type != ServerType::Local) {
        return Error{ErrorCode::InvalidArgument, "Only local servers can be started"};
    }

    std::lock_guard<std::mutex> guard(server_mutex(id));
    const Target target = target_for(record);
    session_.reset(target);

    std::optional<std::filesystem::path> working_directory;
    if (record.working_directory && !record.working_directory->empty()) {
        working_directory = *record.working_directory;
    }

    auto started = supervisor_.start(id, record.name, record.command, record.args, working_directory);
    if (!started) {
        store_.update_process_status(id, ServerStatus::Error);
        store_.update_server_status(id, ServerStatus::Error);
        return Error{started.error().code, "Failed to start server: " + started.error().message,
                     started.error().exit_code};
    }

    store_.update_process_status(id, ServerStatus::Running);
    store_.update_server_status(id, ServerStatus::Connected);

    StartReport report;
    auto handshake = session_.initialize(target);
    if (!handshake) {
        report.message = "Server started but MCP handshake failed: " + handshake.error().message;
        spdlog::warn("{} ({})", report.message, record.name);
        return report;
    }
    if (!handshake.value().contains("result")) {
        report.message = "Server started but MCP handshake failed - check server logs";
        spdlog::warn("Handshake with {} returned no result: {}", record.name, handshake.value().dump());
        return report;
    }
    report.handshake_ok = true;

    auto tools = session_.list_tools(target);
    if (!tools) {
        report.message = "Server started but tool discovery failed: " + tools.error().message;
        spdlog::warn("{} ({})", report.message, record.name);
        return report;
    }

    report.tools = std::move(tools).value();
    if (!report.tools.empty()) {
        store_.store_tools(id, report.tools);
    }
    report.message = "Server started successfully with " + std::to_string(report.tools.size()) +
                     " tools discovered";
    spdlog::info("{}: {}", record.name, report.message);
    return report;
}

Result<void> ServerController::stop_server(ServerId id) {
    auto found = find_record(id);
    if (!found) {
        return found.error();
    }
    if (found.value().type != ServerType::Local) {
        return Error{ErrorCode::InvalidArgument, "Only local servers can be stopped"};
    }

    std::lock_guard<std::mutex> guard(server_mutex(id));
    auto stopped = supervisor_.stop(id);
    if (!stopped) {
        return Error{stopped.error().code, "Failed to stop server: " + stopped.error().message};
    }

    session_.reset(LocalTarget{id});
    store_.update_process_status(id, ServerStatus::Stopped);
    store_.update_server_status(id, ServerStatus::Stopped);
    return {};
}

Result<std::vector<ToolDescriptor>> ServerController::connect_remote(ServerId id) {
    auto found = find_record(id);
    if (!found) {
        return found.error();
    }
    const ServerRecord& record = found.value();
    if (record.type != ServerType::Remote) {
        return Error{ErrorCode::InvalidArgument, "Only remote servers can be connected"};
    }

    std::lock_guard<std::mutex> guard(server_mutex(id));
    const Target target = target_for(record);

    if (!session_.test_connection(target)) {
        store_.update_server_status(id, ServerStatus::Error);
        return Error{ErrorCode::TransportError, "Connection test failed for " + record.url};
    }
    store_.update_server_status(id, ServerStatus::Connected);

    auto tools = session_.list_tools(target);
    if (!tools) {
        spdlog::warn("Tool discovery on {} failed: {}", record.name, tools.error().message);
        return tools.error();
    }
    store_.store_tools(id, tools.value());
    return tools;
}

Result<ProcessHealth> ServerController::server_health(ServerId id) {
    auto found = find_record(id);
    if (!found) {
        return found.error();
    }
    if (found.value().type != ServerType::Local) {
        return Error{ErrorCode::InvalidArgument, "Health check only available for local servers"};
    }

    std::lock_guard<std::mutex> guard(server_mutex(id));
    ProcessHealth health = supervisor_.health(id);

    if (!health.running()) {
        supervisor_.cleanup_dead_processes();
        store_.update_process_status(id, ServerStatus::Stopped);
        bool crashed = health.status == ProcessStatus::Exited && health.exit_code.value_or(-1) != 0;
        store_.update_server_status(id, crashed ? ServerStatus::Error : ServerStatus::Stopped);
    }
    return health;
}

HealthSummary ServerController::all_health() {
    HealthSummary summary;
    summary.health = supervisor_.all_health();

    // A process may die between the snapshot and the reap; the reaped view wins
    auto removed = supervisor_.reap_dead_processes();
    summary.cleaned_processes = removed.size();
    for (const auto& [id, health] : removed) {
        summary.health[id] = health;
        store_.update_process_status(id, ServerStatus::Stopped);
        bool crashed = health.exit_code.value_or(-1) != 0;
        store_.update_server_status(id, crashed ? ServerStatus::Error : ServerStatus::Stopped);
    }
    return summary;
}

Result<std::vector<ToolDescriptor>> ServerController::list_tools(ServerId id) {
    auto found = find_record(id);
    if (!found) {
        return found.error();
    }

    std::lock_guard<std::mutex> guard(server_mutex(id));
    return session_.list_tools(target_for(found.value()));
}

Result<json> ServerController::call_tool(ServerId id, const std::string& tool_name, const json& arguments) {
    auto found = find_record(id);
    if (!found) {
        return found.error();
    }
    const ServerRecord& record = found.value();

    spdlog::debug("Calling tool {} on {} server {}", tool_name,
        record.type == ServerType::Local ? "local" : "remote", id);

    std::lock_guard<std::mutex> guard(server_mutex(id));
    auto response = session_.call_tool(target_for(record), tool_name, arguments);
    if (!response) {
        return response.error();
    }

    const json& body = response.value();
    if (body.is_object() && body.contains("error")) {
        const json& error = body["error"];
        std::string message = error.is_object() && error.contains("message") && error["message"].is_string()
            ? error["message"].get<std::string>()
            : error.dump();
        spdlog::warn("Tool {} on server {} returned error: {}", tool_name, id, error.dump());
        return Error{ErrorCode::ProtocolError, message};
    }
    if (body.is_object() && body.contains("result")) {
        return body["result"];
    }
    return Error{ErrorCode::ProtocolError, "Invalid response format from MCP server"};
}

bool ServerController::test_connection(ServerId id) {
    auto found = find_record(id);
    if (!found) {
        return false;
    }

    std::lock_guard<std::mutex> guard(server_mutex(id));
    return session_.test_connection(target_for(found.value()));
}

void ServerController::reconcile_on_startup() {
    auto servers = store_.get_servers();
    std::size_t local_count = 0;

    for (const auto& server : servers) {
        if (server.type != ServerType::Local) {
            continue;
        }
        ++local_count;

        bool marked_running = server.status == ServerStatus::Connected ||
                              server.process_status == ServerStatus::Running;
        if (!marked_running) {
            continue;
        }

        std::lock_guard<std::mutex> guard(server_mutex(server.id));
        if (!supervisor_.is_running(server.id)) {
            spdlog::info("Server {} ({}) not actually running, updating status", server.id, server.name);
            store_.update_process_status(server.id, ServerStatus::Stopped);
            store_.update_server_status(server.id, ServerStatus::Stopped);
        }
    }

    spdlog::debug("Startup reconciliation checked {} local servers", local_count);
}

void ServerController::shutdown() {
    auto running = supervisor_.running_servers();
    supervisor_.shutdown_all();

    for (ServerId id : running) {
        if (!supervisor_.is_running(id)) {
            store_.update_process_status(id, ServerStatus::Stopped);
            store_.update_server_status(id, ServerStatus::Stopped);
        }
    }
}

} // namespace mcp_host
