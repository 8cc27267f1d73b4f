#include "Messages.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <cstdint>
#include <cstdio>
#include <random>

namespace mcp_host {

void to_json(json& j, const ToolDescriptor& tool) {
    j = json{
        {"name", tool.name},
        {"description", tool.description},
        {"inputSchema", tool.input_schema.is_null() ? json::object() : tool.input_schema}
    };
}

void from_json(const json& j, ToolDescriptor& tool) {
    tool.name = j.at("name").get<std::string>();

    const auto description = j.find("description");
    tool.description = (description != j.end() && description->is_string())
        ? description->get<std::string>()
        : std::string();

    tool.input_schema = j.value("inputSchema", json::object());
}

std::string generate_request_id() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;

    std::array<std::uint8_t, 16> bytes{};
    std::uint64_t high = dist(engine);
    std::uint64_t low = dist(engine);
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<std::uint8_t>(high >> (56 - 8 * i));
        bytes[8 + i] = static_cast<std::uint8_t>(low >> (56 - 8 * i));
    }

    // Version 4, RFC 4122 variant
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    char text[37];
    std::snprintf(text, sizeof(text),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
        bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(text);
}

json make_request(const std::string& method, const json& params) {
    return {
        {"jsonrpc", protocol::kJsonRpcVersion},
        {"id", generate_request_id()},
        {"method", method},
        {"params", params}
    };
}

json make_notification(const std::string& method, const json& params) {
    return {
        {"jsonrpc", protocol::kJsonRpcVersion},
        {"method", method},
        {"params", params}
    };
}

json make_initialize_params() {
    return {
        {"protocolVersion", protocol::kProtocolVersion},
        {"capabilities", {
            {"tools", json::object()},
            {"logging", json::object()}
        }},
        {"clientInfo", {
            {"name", protocol::kClientName},
            {"version", protocol::kClientVersion}
        }}
    };
}

json make_tool_call_params(const std::string& tool_name, const json& arguments) {
    return {
        {"name", tool_name},
        {"arguments", arguments.is_null() ? json::object() : arguments}
    };
}

bool is_valid_handshake(const json& response) {
    if (!response.is_object()) {
        return false;
    }
    const auto result = response.find("result");
    return result != response.end() && result->is_object() && result->contains("protocolVersion");
}

std::vector<ToolDescriptor> parse_tool_list(const json& response) {
    std::vector<ToolDescriptor> tools;

    if (!response.is_object() || !response.contains("result")) {
        return tools;
    }
    const json& result = response["result"];
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
        return tools;
    }

    for (const auto& entry : result["tools"]) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            spdlog::warn("Skipping malformed tool entry: {}", entry.dump());
            continue;
        }
        tools.push_back(entry.get<ToolDescriptor>());
    }

    return tools;
}

} // namespace mcp_host
