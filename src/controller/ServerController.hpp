#pragma once

#include "core/Error.hpp"
#include "mcp/ProtocolSession.hpp"
#include "process/ProcessSupervisor.hpp"
#include "store/IServerStore.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcp_host {

/**
 * @brief Outcome of starting a local server
 *
 * The process is running whenever this is returned; the handshake or tool
 * discovery may still have failed, which message explains.
 */
struct StartReport {
    bool handshake_ok = false;
    std::vector<ToolDescriptor> tools;
    std::string message;
};

struct HealthSummary {
    std::map<ServerId, ProcessHealth> health;
    std::size_t cleaned_processes = 0;
};

/**
 * @brief Operations an upstream request layer invokes for configured servers
 *
 * Combines the store, the supervisor and the protocol session. Every
 * per-server operation holds that server's mutex, so start/stop/health and
 * protocol calls for one id never interleave. Failures come back as Result
 * errors, never as exceptions.
 */
class ServerController {
public:
    ServerController(IServerStore& store, ProcessSupervisor& supervisor, ProtocolSession& session);

    /**
     * @brief Start a local server, handshake and discover its tools
     */
    Result<StartReport> start_server(ServerId id);

    Result<void> stop_server(ServerId id);

    /**
     * @brief Test a remote server, discover and store its tools
     */
    Result<std::vector<ToolDescriptor>> connect_remote(ServerId id);

    /**
     * @brief Health of a local server; a dead process is cleaned up and
     * reflected in the store
     */
    Result<ProcessHealth> server_health(ServerId id);

    /**
     * @brief Health of every supervised process, then cleanup of dead ones
     */
    HealthSummary all_health();

    Result<std::vector<ToolDescriptor>> list_tools(ServerId id);

    /**
     * @brief Call a tool and interpret the JSON-RPC response
     * @return The response's result object, or ProtocolError carrying the
     * server's error payload
     */
    Result<json> call_tool(ServerId id, const std::string& tool_name, const json& arguments);

    bool test_connection(ServerId id);

    /**
     * @brief Mark servers stored as running/connected but not actually alive
     * as stopped
     */
    void reconcile_on_startup();

    void shutdown();

private:
    std::mutex& server_mutex(ServerId id);

    Result<ServerRecord> find_record(ServerId id) const;

    static Target target_for(const ServerRecord& record);

    IServerStore& store_;
    ProcessSupervisor& supervisor_;
    ProtocolSession& session_;

    std::mutex locks_mutex_;
    std::map<ServerId, std::unique_ptr<std::mutex>> server_locks_;
};

} // namespace mcp_host
