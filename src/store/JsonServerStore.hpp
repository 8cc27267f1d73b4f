#pragma once

#include "store/IServerStore.hpp"
#include "core/Error.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>

namespace mcp_host {

/**
 * @brief In-memory server table, optionally backed by a JSON file
 *
 * File layout: {"servers": [ServerRecord, ...]}. Ids must be unique and
 * positive; records added with id 0 get the next free id.
 */
class JsonServerStore : public IServerStore {
public:
    JsonServerStore() = default;
    explicit JsonServerStore(std::filesystem::path path);

    /**
     * @brief Replace the table with the contents of the backing file
     */
    Result<void> load();

    /**
     * @brief Write the table to the backing file
     */
    Result<void> save() const;

    /**
     * @brief Save after every status or tool update
     */
    void set_autosave(bool enabled);

    /**
     * @brief Insert or replace a record
     * @return Id of the stored record
     */
    ServerId add_server(ServerRecord record);

    bool remove_server(ServerId id);

    std::vector<ServerRecord> get_servers() const override;
    std::optional<ServerRecord> get_server(ServerId id) const override;
    void update_process_status(ServerId id, ServerStatus status) override;
    void update_server_status(ServerId id, ServerStatus status) override;
    void store_tools(ServerId id, const std::vector<ToolDescriptor>& tools) override;

private:
    Result<void> save_locked() const;
    void autosave_locked() const;

    std::optional<std::filesystem::path> path_;
    bool autosave_ = false;

    mutable std::mutex mutex_;
    std::map<ServerId, ServerRecord> servers_;
};

} // namespace mcp_host
