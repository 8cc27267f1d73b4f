#pragma once

#include "core/Error.hpp"
#include "protocol/Messages.hpp"
#include "transport/HttpTransport.hpp"
#include "transport/PipeTransport.hpp"
#include "transport/Target.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace mcp_host {

/**
 * @brief Handshake progress for one target
 */
enum class SessionState {
    Uninitialized,
    Initializing,
    Ready
};

const char* to_string(SessionState state);

/**
 * @brief MCP client calls over either transport
 *
 * Local targets go through the supervisor's pipes, remote targets over HTTP.
 * Transport and decode failures come back as Result errors; JSON-RPC error
 * responses are returned as-is for the caller to interpret.
 */
class ProtocolSession {
public:
    explicit ProtocolSession(ProcessSupervisor& supervisor,
                             PipeOptions pipe_options = {},
                             HttpOptions http_options = {});

    /**
     * @brief initialize request, then notifications/initialized on success
     *
     * The notification is fire-and-forget: a delivery failure is logged and
     * the target still becomes Ready.
     * @return Raw decoded initialize response
     */
    Result<json> initialize(const Target& target);

    /**
     * @brief tools/list; a malformed or absent list yields an empty vector
     */
    Result<std::vector<ToolDescriptor>> list_tools(const Target& target);

    /**
     * @brief tools/call with {name, arguments}
     * @return Raw decoded response (result or error)
     */
    Result<json> call_tool(const Target& target, const std::string& tool_name, const json& arguments);

    /**
     * @brief initialize and check result.protocolVersion; never fails loudly
     */
    bool test_connection(const Target& target);

    SessionState state(const Target& target) const;

    /**
     * @brief Forget handshake state, e.g. after the local process restarted
     */
    void reset(const Target& target);

private:
    Result<json> send(const Target& target, const json& message);
    Result<void> notify(const Target& target, const json& message);

    void set_state(const Target& target, SessionState state);

    ProcessSupervisor& supervisor_;
    PipeTransport pipe_;
    HttpTransport http_;

    mutable std::mutex state_mutex_;
    std::map<std::string, SessionState> states_;
};

} // namespace mcp_host
