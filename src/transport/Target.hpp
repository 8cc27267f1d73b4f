#pragma once

#include "process/ProcessSupervisor.hpp"
#include <string>
#include <variant>

namespace mcp_host {

/**
 * @brief Agent running as a supervised child process
 */
struct LocalTarget {
    ServerId id = 0;
};

/**
 * @brief Agent reached over HTTP POST
 */
struct RemoteTarget {
    std::string url;
    std::string api_key;  // Empty means no Authorization header
};

using Target = std::variant<LocalTarget, RemoteTarget>;

/**
 * @brief Stable key for per-target bookkeeping ("local:<id>" or the URL)
 */
inline std::string target_key(const Target& target) {
    if (const auto* local = std::get_if<LocalTarget>(&target)) {
        return "local:" + std::to_string(local->id);
    }
    return std::get<RemoteTarget>(target).url;
}

} // namespace mcp_host
