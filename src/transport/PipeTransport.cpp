#include "PipeTransport.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace mcp_host {

namespace {

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

PipeTransport::PipeTransport(ProcessSupervisor& supervisor, PipeOptions options)
    : supervisor_(supervisor), options_(options) {}

Result<std::shared_ptr<AgentProcessHandle>> PipeTransport::running_handle(ServerId id) const {
    auto handle = supervisor_.find(id);
    if (!handle || !handle->process->is_running()) {
        spdlog::warn("Cannot send request to server {}: not running", id);
        return Error{ErrorCode::NotRunning, "Server " + std::to_string(id) + " is not running"};
    }
    return handle;
}

Result<json> PipeTransport::send(ServerId id, const json& message, std::chrono::milliseconds timeout) {
    auto found = running_handle(id);
    if (!found) {
        return found.error();
    }
    auto handle = std::move(found).value();
    auto& process = *handle->process;

    if (timeout.count() <= 0) {
        timeout = options_.response_timeout;
    }

    std::lock_guard<std::mutex> exchange(process.io_mutex());

    const std::string method = message.value("method", "unknown");
    spdlog::debug("Sending request to {}: {}", handle->name, method);

    auto written = process.write_line(message.dump());
    if (!written) {
        spdlog::error("Communication error with {}: {}", handle->name, written.error().message);
        return written.error();
    }

    auto line = process.read_line(timeout);
    if (!line) {
        if (line.error() == ErrorCode::TransportTimeout) {
            spdlog::error("Request {} to {} timed out after {}ms", method, handle->name, timeout.count());
        } else {
            spdlog::error("Communication error with {}: {}", handle->name, line.error().message);
        }
        return line.error();
    }

    if (is_blank(line.value())) {
        spdlog::warn("Empty response from {}", handle->name);
        return Error{ErrorCode::ProtocolError, "Empty response line from " + handle->name};
    }

    try {
        json response = json::parse(line.value());
        spdlog::debug("Received response from {}", handle->name);
        return response;
    } catch (const json::parse_error& e) {
        spdlog::error("Invalid JSON response from server {}: {}", id, e.what());
        return Error{ErrorCode::TransportError, std::string("Invalid JSON response: ") + e.what()};
    }
}

Result<void> PipeTransport::notify(ServerId id, const json& message) {
    auto found = running_handle(id);
    if (!found) {
        return found.error();
    }
    auto handle = std::move(found).value();

    std::lock_guard<std::mutex> exchange(handle->process->io_mutex());
    spdlog::debug("Sending notification to {}: {}", handle->name, message.value("method", "unknown"));
    return handle->process->write_line(message.dump());
}

} // namespace mcp_host
