#include "ProtocolSession.hpp"
#include <spdlog/spdlog.h>

namespace mcp_host {

namespace {

std::string string_field(const json& object, const char* key) {
    if (!object.is_object()) {
        return "unknown";
    }
    auto it = object.find(key);
    return it != object.end() && it->is_string() ? it->get<std::string>() : "unknown";
}

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initializing: return "initializing";
        case SessionState::Ready: return "ready";
    }
    return "uninitialized";
}

ProtocolSession::ProtocolSession(ProcessSupervisor& supervisor,
                                 PipeOptions pipe_options,
                                 HttpOptions http_options)
    : supervisor_(supervisor),
      pipe_(supervisor, pipe_options),
      http_(std::move(http_options)) {}

Result<json> ProtocolSession::send(const Target& target, const json& message) {
    if (const auto* local = std::get_if<LocalTarget>(&target)) {
        return pipe_.send(local->id, message);
    }
    return http_.send(std::get<RemoteTarget>(target), message);
}

Result<void> ProtocolSession::notify(const Target& target, const json& message) {
    if (const auto* local = std::get_if<LocalTarget>(&target)) {
        return pipe_.notify(local->id, message);
    }
    return http_.notify(std::get<RemoteTarget>(target), message);
}

Result<json> ProtocolSession::initialize(const Target& target) {
    const std::string key = target_key(target);
    spdlog::info("Initializing MCP connection to {}", key);
    set_state(target, SessionState::Initializing);

    auto response = send(target, make_request(protocol::kMethodInitialize, make_initialize_params()));
    if (!response) {
        set_state(target, SessionState::Uninitialized);
        return Error{response.error().code,
            "Failed to initialize MCP connection: " + response.error().message};
    }

    const json& body = response.value();
    if (!body.is_object() || !body.contains("result")) {
        spdlog::warn("Initialize response from {} has no result: {}", key, body.dump());
        set_state(target, SessionState::Uninitialized);
        return response;
    }

    set_state(target, SessionState::Ready);

    auto notified = notify(target, make_notification(protocol::kMethodInitialized));
    if (!notified) {
        spdlog::warn("Failed to send initialized notification to {}: {}", key, notified.error().message);
    }

    if (body["result"].is_object() && body["result"].contains("serverInfo")) {
        // Agents are not trusted to send well-typed identity fields
        const json& info = body["result"]["serverInfo"];
        spdlog::info("Connected to {} version {}", string_field(info, "name"), string_field(info, "version"));
    }
    return response;
}

Result<std::vector<ToolDescriptor>> ProtocolSession::list_tools(const Target& target) {
    auto response = send(target, make_request(protocol::kMethodToolsList));
    if (!response) {
        return Error{response.error().code, "Failed to list tools: " + response.error().message};
    }

    auto tools = parse_tool_list(response.value());
    spdlog::debug("Discovered {} tools on {}", tools.size(), target_key(target));
    return tools;
}

Result<json> ProtocolSession::call_tool(const Target& target, const std::string& tool_name, const json& arguments) {
    spdlog::debug("Calling tool {} on {} with args: {}", tool_name, target_key(target), arguments.dump());

    auto response = send(target, make_request(protocol::kMethodToolsCall,
                                              make_tool_call_params(tool_name, arguments)));
    if (!response) {
        return Error{response.error().code,
            "Failed to call tool " + tool_name + ": " + response.error().message};
    }
    return response;
}

bool ProtocolSession::test_connection(const Target& target) {
    if (const auto* local = std::get_if<LocalTarget>(&target)) {
        if (!supervisor_.is_running(local->id)) {
            return false;
        }
    }

    try {
        auto response = initialize(target);
        return response && is_valid_handshake(response.value());
    } catch (const std::exception& e) {
        spdlog::error("Connection test for {} failed: {}", target_key(target), e.what());
        return false;
    }
}

SessionState ProtocolSession::state(const Target& target) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = states_.find(target_key(target));
    return it == states_.end() ? SessionState::Uninitialized : it->second;
}

void ProtocolSession::reset(const Target& target) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    states_.erase(target_key(target));
}

void ProtocolSession::set_state(const Target& target, SessionState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    states_[target_key(target)] = state;
}

} // namespace mcp_host
