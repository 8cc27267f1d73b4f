#include "CommandResolver.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace mcp_host {

bool CommandResolver::is_executable_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::filesystem::path> CommandResolver::search_path(const std::string& name) {
    const char* env_path = std::getenv("PATH");
    if (env_path == nullptr || *env_path == '\0') {
        spdlog::debug("PATH is empty, cannot resolve {}", name);
        return std::nullopt;
    }

    std::istringstream dirs(env_path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        // An empty PATH entry means the current directory
        std::filesystem::path candidate = dir.empty()
            ? std::filesystem::path(".") / name
            : std::filesystem::path(dir) / name;

        if (is_executable_file(candidate)) {
            return candidate;
        }
    }

    return std::nullopt;
}

std::optional<std::filesystem::path> CommandResolver::resolve(const std::string& command) {
    if (command.empty()) {
        return std::nullopt;
    }

    if (command.find('/') != std::string::npos) {
        std::filesystem::path path(command);
        if (is_executable_file(path)) {
            return path;
        }
        spdlog::debug("Command path is not an executable file: {}", command);
        return std::nullopt;
    }

    auto found = search_path(command);
    if (found) {
        spdlog::debug("Resolved command {} to {}", command, found->string());
    } else {
        spdlog::debug("Command {} not found in PATH", command);
    }
    return found;
}

bool CommandResolver::validate(const std::string& command) {
    return resolve(command).has_value();
}

} // namespace mcp_host
