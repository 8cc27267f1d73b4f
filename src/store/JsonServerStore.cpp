#include "JsonServerStore.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <set>
#include <vector>
#include <stdexcept>

namespace mcp_host {

std::string to_string(ServerStatus status) {
    return json(status).get<std::string>();
}

void to_json(json& j, const ServerRecord& record) {
    j = json{
        {"id", record.id},
        {"name", record.name},
        {"type", record.type},
        {"enabled", record.enabled},
        {"status", record.status},
        {"process_status", record.process_status}
    };

    if (record.type == ServerType::Local) {
        j["command"] = record.command;
        j["args"] = record.args;
        j["working_directory"] = record.working_directory ? json(*record.working_directory) : json();
    } else {
        j["url"] = record.url;
        if (!record.api_key.empty()) {
            j["api_key"] = record.api_key;
        }
    }

    if (!record.tools.empty()) {
        j["tools"] = record.tools;
    }
}

void from_json(const json& j, ServerRecord& record) {
    record.id = j.value("id", ServerId{0});
    record.name = j.at("name").get<std::string>();
    record.type = j.value("type", ServerType::Remote);
    record.command = j.value("command", std::string());
    record.args = j.value("args", std::vector<std::string>{});
    record.url = j.value("url", std::string());
    record.api_key = j.value("api_key", std::string());
    record.enabled = j.value("enabled", true);
    record.status = j.value("status", ServerStatus::Disconnected);
    record.process_status = j.value("process_status", ServerStatus::Stopped);

    record.working_directory.reset();
    if (j.contains("working_directory") && j["working_directory"].is_string()) {
        record.working_directory = j["working_directory"].get<std::string>();
    }

    record.tools.clear();
    if (j.contains("tools") && j["tools"].is_array()) {
        record.tools = j["tools"].get<std::vector<ToolDescriptor>>();
    }

    if (record.name.empty()) {
        throw std::invalid_argument("Server name cannot be empty");
    }
    if (record.type == ServerType::Local && record.command.empty()) {
        throw std::invalid_argument("Local server " + record.name + " has no command");
    }
    if (record.type == ServerType::Remote && record.url.empty()) {
        throw std::invalid_argument("Remote server " + record.name + " has no url");
    }
}

JsonServerStore::JsonServerStore(std::filesystem::path path)
    : path_(std::move(path)) {}

Result<void> JsonServerStore::load() {
    if (!path_) {
        return Error{ErrorCode::ConfigError, "Store has no backing file"};
    }

    std::ifstream in(*path_);
    if (!in) {
        return Error{ErrorCode::ConfigError, "Cannot open " + path_->string()};
    }

    std::map<ServerId, ServerRecord> loaded;
    try {
        json document = json::parse(in);
        if (!document.is_object() || !document.contains("servers") || !document["servers"].is_array()) {
            return Error{ErrorCode::ConfigError, path_->string() + ": expected an object with a servers array"};
        }

        std::set<std::string> names;
        std::vector<ServerRecord> unnumbered;
        ServerId max_id = 0;
        for (const auto& entry : document["servers"]) {
            auto record = entry.get<ServerRecord>();
            if (record.id < 0) {
                return Error{ErrorCode::ConfigError, "Negative id for server " + record.name};
            }
            if (!names.insert(record.name).second) {
                return Error{ErrorCode::ConfigError, "Duplicate server name " + record.name};
            }
            if (record.id == 0) {
                unnumbered.push_back(std::move(record));
                continue;
            }
            if (loaded.count(record.id) > 0) {
                return Error{ErrorCode::ConfigError, "Duplicate server id " + std::to_string(record.id)};
            }
            max_id = std::max(max_id, record.id);
            loaded.emplace(record.id, std::move(record));
        }

        // Records without an id are numbered after every explicit id
        for (auto& record : unnumbered) {
            record.id = ++max_id;
            loaded.emplace(record.id, std::move(record));
        }
    } catch (const std::exception& e) {
        return Error{ErrorCode::ConfigError, path_->string() + ": " + e.what()};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    servers_ = std::move(loaded);
    spdlog::info("Loaded {} servers from {}", servers_.size(), path_->string());
    return {};
}

Result<void> JsonServerStore::save() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_locked();
}

Result<void> JsonServerStore::save_locked() const {
    if (!path_) {
        return Error{ErrorCode::ConfigError, "Store has no backing file"};
    }

    json servers = json::array();
    for (const auto& entry : servers_) {
        servers.push_back(entry.second);
    }

    std::ofstream out(*path_, std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::ConfigError, "Cannot write " + path_->string()};
    }
    out << json{{"servers", servers}}.dump(2) << std::endl;
    if (!out) {
        return Error{ErrorCode::ConfigError, "Write to " + path_->string() + " failed"};
    }
    return {};
}

void JsonServerStore::autosave_locked() const {
    if (!autosave_ || !path_) {
        return;
    }
    auto saved = save_locked();
    if (!saved) {
        spdlog::error("Failed to save server store: {}", saved.error().message);
    }
}

void JsonServerStore::set_autosave(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    autosave_ = enabled;
}

ServerId JsonServerStore::add_server(ServerRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (record.id <= 0) {
        record.id = servers_.empty() ? 1 : servers_.rbegin()->first + 1;
    }
    ServerId id = record.id;
    servers_[id] = std::move(record);
    autosave_locked();
    return id;
}

bool JsonServerStore::remove_server(ServerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool removed = servers_.erase(id) > 0;
    if (removed) {
        autosave_locked();
    }
    return removed;
}

std::vector<ServerRecord> JsonServerStore::get_servers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ServerRecord> records;
    records.reserve(servers_.size());
    for (const auto& entry : servers_) {
        records.push_back(entry.second);
    }
    return records;
}

std::optional<ServerRecord> JsonServerStore::get_server(ServerId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void JsonServerStore::update_process_status(ServerId id, ServerStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) {
        spdlog::warn("Process status update for unknown server {}", id);
        return;
    }
    it->second.process_status = status;
    autosave_locked();
}

void JsonServerStore::update_server_status(ServerId id, ServerStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) {
        spdlog::warn("Server status update for unknown server {}", id);
        return;
    }
    it->second.status = status;
    autosave_locked();
}

void JsonServerStore::store_tools(ServerId id, const std::vector<ToolDescriptor>& tools) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) {
        spdlog::warn("Tool update for unknown server {}", id);
        return;
    }
    it->second.tools = tools;
    autosave_locked();
}

} // namespace mcp_host
