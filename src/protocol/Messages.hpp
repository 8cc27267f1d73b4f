#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_host {

using json = nlohmann::json;

namespace protocol {

inline constexpr const char* kJsonRpcVersion = "2.0";
inline constexpr const char* kProtocolVersion = "2025-06-18";
inline constexpr const char* kClientName = "mcp-host";
inline constexpr const char* kClientVersion = "1.0.0";

inline constexpr const char* kMethodInitialize = "initialize";
inline constexpr const char* kMethodInitialized = "notifications/initialized";
inline constexpr const char* kMethodToolsList = "tools/list";
inline constexpr const char* kMethodToolsCall = "tools/call";

} // namespace protocol

/**
 * @brief Tool metadata as returned by tools/list
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

void to_json(json& j, const ToolDescriptor& tool);
void from_json(const json& j, ToolDescriptor& tool);

/**
 * @brief Fresh random request id (UUID version 4 text form)
 */
std::string generate_request_id();

/**
 * @brief Build a JSON-RPC 2.0 request with a generated id
 */
json make_request(const std::string& method, const json& params = json::object());

/**
 * @brief Build a JSON-RPC 2.0 notification (no id, no response expected)
 */
json make_notification(const std::string& method, const json& params = json::object());

/**
 * @brief Params for the initialize request
 *
 * Carries the protocol version, the declared client capabilities
 * (tools, logging) and the client identity.
 */
json make_initialize_params();

/**
 * @brief Params for tools/call
 */
json make_tool_call_params(const std::string& tool_name, const json& arguments);

/**
 * @brief True if the response carries result.protocolVersion
 */
bool is_valid_handshake(const json& response);

/**
 * @brief Extract result.tools from a tools/list response
 *
 * Malformed or absent lists yield an empty vector; entries without a string
 * name are skipped.
 */
std::vector<ToolDescriptor> parse_tool_list(const json& response);

} // namespace mcp_host
