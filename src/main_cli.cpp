#include "controller/ServerController.hpp"
#include "core/CommandResolver.hpp"
#include "core/Logging.hpp"
#include "mcp/ProtocolSession.hpp"
#include "process/ProcessSupervisor.hpp"
#include "store/JsonServerStore.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace {
    std::atomic<bool> shutdown_requested{false};

    void signal_handler(int) {
        shutdown_requested = true;
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    void print_tools(const std::vector<mcp_host::ToolDescriptor>& tools) {
        std::cout << nlohmann::json(tools).dump(2) << std::endl;
    }

    int report_failure(const mcp_host::Error& error) {
        std::cerr << error.describe() << std::endl;
        return 1;
    }

    int run_check(mcp_host::ServerController& controller, const mcp_host::ServerRecord& record) {
        if (record.type == mcp_host::ServerType::Remote) {
            auto tools = controller.connect_remote(record.id);
            if (!tools) {
                return report_failure(tools.error());
            }
            print_tools(tools.value());
            return 0;
        }

        auto started = controller.start_server(record.id);
        if (!started) {
            return report_failure(started.error());
        }
        std::cout << started.value().message << std::endl;
        print_tools(started.value().tools);

        auto health = controller.server_health(record.id);
        if (health) {
            std::cout << nlohmann::json(health.value()).dump(2) << std::endl;
        }

        auto stopped = controller.stop_server(record.id);
        if (!stopped) {
            return report_failure(stopped.error());
        }
        return started.value().handshake_ok ? 0 : 2;
    }

    int run_call(mcp_host::ServerController& controller,
                 const mcp_host::ServerRecord& record,
                 const std::string& tool_name,
                 const std::string& args_text) {
        nlohmann::json arguments;
        try {
            arguments = args_text.empty() ? nlohmann::json::object() : nlohmann::json::parse(args_text);
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "Invalid --args JSON: " << e.what() << std::endl;
            return 1;
        }

        if (record.type == mcp_host::ServerType::Local) {
            auto started = controller.start_server(record.id);
            if (!started) {
                return report_failure(started.error());
            }
            if (!started.value().handshake_ok) {
                std::cerr << started.value().message << std::endl;
            }
        } else if (!controller.test_connection(record.id)) {
            std::cerr << "Cannot connect to " << record.url << std::endl;
            return 1;
        }

        auto result = controller.call_tool(record.id, tool_name, arguments);
        controller.shutdown();

        if (!result) {
            return report_failure(result.error());
        }
        std::cout << result.value().dump(2) << std::endl;
        return 0;
    }

    int run_serve(mcp_host::ServerController& controller,
                  mcp_host::IServerStore& store,
                  int health_interval_seconds) {
        setup_signal_handlers();
        controller.reconcile_on_startup();

        for (const auto& record : store.get_servers()) {
            if (record.type != mcp_host::ServerType::Local || !record.enabled) {
                continue;
            }
            auto started = controller.start_server(record.id);
            if (!started) {
                spdlog::error("Server {} failed to start: {}", record.name, started.error().describe());
            }
        }

        spdlog::info("Serving, health check every {}s", health_interval_seconds);
        auto next_check = std::chrono::steady_clock::now() + std::chrono::seconds(health_interval_seconds);

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            if (std::chrono::steady_clock::now() < next_check) {
                continue;
            }
            next_check += std::chrono::seconds(health_interval_seconds);

            auto summary = controller.all_health();
            if (summary.cleaned_processes > 0) {
                spdlog::warn("Cleaned up {} dead processes", summary.cleaned_processes);
            }
        }

        spdlog::info("Shutdown requested");
        controller.shutdown();
        return 0;
    }
}

int main(int argc, char** argv) {
    CLI::App app{"mcp-host - supervise local MCP agents and talk to remote ones"};
    app.require_subcommand(0, 1);

    std::string config_path = "servers.json";
    app.add_option("-c,--config", config_path, "Server configuration file (JSON)")
        ->default_val("servers.json");

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info");

    std::string logs_dir = "logs";
    app.add_option("--logs-dir", logs_dir, "Directory for per-server launch and error logs")
        ->default_val("logs");

    bool save = false;
    app.add_flag("--save", save, "Write status and tool changes back to the configuration file");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    auto* validate_cmd = app.add_subcommand("validate", "Check that a command resolves to an executable");
    std::string command_to_validate;
    validate_cmd->add_option("command", command_to_validate, "Program name or path")->required();

    auto* servers_cmd = app.add_subcommand("servers", "List configured servers");

    auto* check_cmd = app.add_subcommand("check", "Start/connect a server, discover tools, stop");
    mcp_host::ServerId check_id = 0;
    check_cmd->add_option("id", check_id, "Server id")->required();

    auto* call_cmd = app.add_subcommand("call", "Call a tool on a server");
    mcp_host::ServerId call_id = 0;
    std::string tool_name;
    std::string args_text;
    int call_timeout = 10;
    call_cmd->add_option("id", call_id, "Server id")->required();
    call_cmd->add_option("tool", tool_name, "Tool name")->required();
    call_cmd->add_option("--args", args_text, "Tool arguments as a JSON object");
    call_cmd->add_option("--timeout", call_timeout, "Response timeout for local servers (seconds)")
        ->default_val(10)
        ->check(CLI::PositiveNumber);

    auto* serve_cmd = app.add_subcommand("serve", "Start enabled local servers and supervise them");
    int health_interval = 30;
    serve_cmd->add_option("--health-interval", health_interval, "Seconds between health checks")
        ->default_val(30)
        ->check(CLI::PositiveNumber);

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "mcp-host version 1.0.0" << std::endl;
        return 0;
    }
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
        return 1;
    }

    mcp_host::use_stderr_logger("mcp-host");
    if (!mcp_host::set_log_level(log_level)) {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return 1;
    }

    if (*validate_cmd) {
        auto resolved = mcp_host::CommandResolver::resolve(command_to_validate);
        if (!resolved) {
            std::cout << command_to_validate << ": not found" << std::endl;
            return 1;
        }
        std::cout << command_to_validate << ": " << resolved->string() << std::endl;
        return 0;
    }

    try {
        mcp_host::JsonServerStore store(config_path);
        auto loaded = store.load();
        if (!loaded) {
            spdlog::critical("{}", loaded.error().describe());
            return 1;
        }
        store.set_autosave(save);

        if (*servers_cmd) {
            std::cout << nlohmann::json(store.get_servers()).dump(2) << std::endl;
            return 0;
        }

        mcp_host::SupervisorOptions supervisor_options;
        supervisor_options.logs_dir = logs_dir;
        mcp_host::ProcessSupervisor supervisor(supervisor_options);

        mcp_host::PipeOptions pipe_options;
        pipe_options.response_timeout = std::chrono::seconds(call_timeout);
        mcp_host::ProtocolSession session(supervisor, pipe_options);
        mcp_host::ServerController controller(store, supervisor, session);

        if (*serve_cmd) {
            return run_serve(controller, store, health_interval);
        }

        const mcp_host::ServerId id = *check_cmd ? check_id : call_id;
        auto record = store.get_server(id);
        if (!record) {
            std::cerr << "Server " << id << " not found in " << config_path << std::endl;
            return 1;
        }

        if (*check_cmd) {
            return run_check(controller, *record);
        }
        return run_call(controller, *record, tool_name, args_text);

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
