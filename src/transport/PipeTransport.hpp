#pragma once

#include "core/Error.hpp"
#include "process/ProcessSupervisor.hpp"
#include <chrono>
#include <nlohmann/json.hpp>

namespace mcp_host {

using json = nlohmann::json;

struct PipeOptions {
    std::chrono::milliseconds response_timeout{10000};
};

/**
 * @brief Line-delimited JSON-RPC over a supervised agent's stdin/stdout
 *
 * One request is in flight per process at a time: the exchange holds the
 * process's io mutex. The next line read is taken as the response; its id is
 * not compared with the request id, so any unsolicited line from the agent
 * is delivered to whoever is waiting.
 */
class PipeTransport {
public:
    explicit PipeTransport(ProcessSupervisor& supervisor, PipeOptions options = {});

    /**
     * @brief Write message as one line, then wait for one response line
     * @param timeout Overrides the configured response timeout when non-zero
     */
    Result<json> send(ServerId id, const json& message,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds::zero());

    /**
     * @brief Write message as one line without reading anything back
     */
    Result<void> notify(ServerId id, const json& message);

private:
    Result<std::shared_ptr<AgentProcessHandle>> running_handle(ServerId id) const;

    ProcessSupervisor& supervisor_;
    PipeOptions options_;
};

} // namespace mcp_host
