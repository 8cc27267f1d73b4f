#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace mcp_host {

/**
 * @brief Set the global log level by name
 * @param level One of trace, debug, info, warn, error, critical
 * @return false if the name is not recognized (level left unchanged)
 */
bool set_log_level(const std::string& level);

/**
 * @brief Route the default logger to stderr so stdout carries only command output
 */
void use_stderr_logger(const std::string& name);

/**
 * @brief Create an unregistered logger writing to a truncated file
 *
 * Used for per-server launch diagnostics. Throws spdlog::spdlog_ex if the
 * file cannot be opened.
 */
std::shared_ptr<spdlog::logger> make_file_logger(const std::string& name,
                                                 const std::filesystem::path& path);

} // namespace mcp_host
