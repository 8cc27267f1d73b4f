#pragma once

#include "process/ProcessSupervisor.hpp"
#include "protocol/Messages.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_host {

using json = nlohmann::json;

enum class ServerType {
    Local,
    Remote
};

/**
 * @brief Status values reported to the store, for both the server
 * connection and the local process
 */
enum class ServerStatus {
    Running,
    Stopped,
    Error,
    Connected,
    Disconnected
};

NLOHMANN_JSON_SERIALIZE_ENUM(ServerType, {
    {ServerType::Local, "local"},
    {ServerType::Remote, "remote"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ServerStatus, {
    {ServerStatus::Disconnected, "disconnected"},
    {ServerStatus::Running, "running"},
    {ServerStatus::Stopped, "stopped"},
    {ServerStatus::Error, "error"},
    {ServerStatus::Connected, "connected"},
})

std::string to_string(ServerStatus status);

/**
 * @brief One configured MCP server
 */
struct ServerRecord {
    ServerId id = 0;
    std::string name;
    ServerType type = ServerType::Remote;

    // Local servers
    std::string command;
    std::vector<std::string> args;
    std::optional<std::string> working_directory;

    // Remote servers
    std::string url;
    std::string api_key;

    bool enabled = true;
    ServerStatus status = ServerStatus::Disconnected;
    ServerStatus process_status = ServerStatus::Stopped;
    std::vector<ToolDescriptor> tools;
};

void to_json(json& j, const ServerRecord& record);
void from_json(const json& j, ServerRecord& record);

/**
 * @brief Storage the controller reads server definitions from and reports
 * status to
 */
class IServerStore {
public:
    virtual ~IServerStore() = default;

    virtual std::vector<ServerRecord> get_servers() const = 0;

    virtual std::optional<ServerRecord> get_server(ServerId id) const = 0;

    virtual void update_process_status(ServerId id, ServerStatus status) = 0;

    virtual void update_server_status(ServerId id, ServerStatus status) = 0;

    /**
     * @brief Replace the discovered tool list of a server
     */
    virtual void store_tools(ServerId id, const std::vector<ToolDescriptor>& tools) = 0;
};

} // namespace mcp_host
