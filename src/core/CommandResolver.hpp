#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace mcp_host {

/**
 * @brief Resolves agent launch commands to executable files
 *
 * A command containing a '/' is checked directly (absolute or relative to the
 * current directory). A bare name is looked up in each directory of $PATH.
 * Nothing is executed.
 */
class CommandResolver {
public:
    /**
     * @brief Resolve command to an executable path
     * @param command Bare program name or path
     * @return Path to a regular file with execute permission, or nullopt
     */
    static std::optional<std::filesystem::path> resolve(const std::string& command);

    /**
     * @brief True iff resolve() finds an executable
     */
    static bool validate(const std::string& command);

private:
    static bool is_executable_file(const std::filesystem::path& path);

    static std::optional<std::filesystem::path> search_path(const std::string& name);
};

} // namespace mcp_host
