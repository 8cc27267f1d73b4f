#pragma once

#include "core/Error.hpp"
#include "transport/Target.hpp"
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_host {

using json = nlohmann::json;

struct HttpOptions {
    std::chrono::milliseconds timeout{30000};
    std::string user_agent = "mcp-host/1.0";
    std::string auth_scheme = "ApiKey";  // Authorization: <scheme> <api_key>
};

/**
 * @brief Synchronous JSON-RPC over HTTP POST (libcurl)
 *
 * Each call performs one blocking request with an overall timeout. Non-2xx
 * statuses, connection failures and undecodable bodies become TransportError.
 */
class HttpTransport {
public:
    explicit HttpTransport(HttpOptions options = {});

    Result<json> send(const RemoteTarget& target, const json& message);

    /**
     * @brief POST a notification; the response body is ignored
     */
    Result<void> notify(const RemoteTarget& target, const json& message);

    const HttpOptions& options() const { return options_; }

private:
    struct Response {
        long status = 0;
        std::string body;
    };

    Result<Response> post(const RemoteTarget& target, const std::string& body);

    HttpOptions options_;
};

} // namespace mcp_host
