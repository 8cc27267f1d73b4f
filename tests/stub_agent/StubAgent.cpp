// Scripted MCP agent used by the tests.
//
// Reads one JSON-RPC message per stdin line and answers requests with the
// result scripted for their method. Notifications get no answer. Every
// received method is appended to --trace so tests can see what arrived.

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <csignal>
#include <fstream>
#include <iostream>
#include <set>
#include <string>

using json = nlohmann::json;

namespace {

json create_error_response(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

json load_script(const std::string& path) {
    if (path.empty()) {
        return json::object();
    }
    std::ifstream in(path);
    if (!in) {
        std::cerr << "stub_agent: cannot open script " << path << std::endl;
        return json::object();
    }
    return json::parse(in);
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"Scripted MCP stub agent"};

    std::string script_path;
    std::string trace_path;
    int exit_immediately = -1;
    bool ignore_sigterm = false;
    std::set<std::string> silent_methods;
    std::set<std::string> blank_methods;
    std::set<std::string> garbage_methods;

    app.add_option("--script", script_path, "JSON object mapping method to result");
    app.add_option("--trace", trace_path, "Append received methods to this file");
    app.add_option("--exit-immediately", exit_immediately, "Exit at once with this code");
    app.add_flag("--ignore-sigterm", ignore_sigterm, "Ignore SIGTERM");
    app.add_option("--silent", silent_methods, "Never answer these methods");
    app.add_option("--blank", blank_methods, "Answer these methods with an empty line");
    app.add_option("--garbage", garbage_methods, "Answer these methods with non-JSON text");

    CLI11_PARSE(app, argc, argv);

    if (exit_immediately >= 0) {
        std::cerr << "stub_agent: exiting with " << exit_immediately << std::endl;
        return exit_immediately;
    }
    if (ignore_sigterm) {
        std::signal(SIGTERM, SIG_IGN);
    }

    json script = load_script(script_path);
    std::ofstream trace;
    if (!trace_path.empty()) {
        trace.open(trace_path, std::ios::app);
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }

        json request;
        try {
            request = json::parse(line);
        } catch (const json::parse_error& e) {
            std::cerr << "stub_agent: parse error: " << e.what() << std::endl;
            std::cout << create_error_response(json(), -32700, "Parse error").dump() << std::endl;
            continue;
        }

        const std::string method = request.value("method", "");
        if (trace.is_open()) {
            trace << method << std::endl;
        }

        // Notifications carry no id and get no response
        if (!request.contains("id")) {
            continue;
        }
        const json id = request["id"];

        if (silent_methods.count(method) > 0) {
            continue;
        }
        if (blank_methods.count(method) > 0) {
            std::cout << "   " << std::endl;
            continue;
        }
        if (garbage_methods.count(method) > 0) {
            std::cout << "this is not json" << std::endl;
            continue;
        }

        if (method == "tools/call" && script.contains("tools/call") && script["tools/call"].is_object()) {
            // Per-tool results: {"tools/call": {"<tool>": result}}
            const std::string tool = request["params"].value("name", "");
            const json& calls = script["tools/call"];
            if (calls.contains(tool)) {
                json response = {{"jsonrpc", "2.0"}, {"id", id}};
                const json& scripted = calls[tool];
                if (scripted.contains("error")) {
                    response["error"] = scripted["error"];
                } else {
                    response["result"] = scripted;
                }
                std::cout << response.dump() << std::endl;
            } else {
                std::cout << create_error_response(id, -32602, "Unknown tool: " + tool).dump() << std::endl;
            }
            continue;
        }

        if (script.contains(method)) {
            json response = {
                {"jsonrpc", "2.0"},
                {"id", id},
                {"result", script[method]}
            };
            std::cout << response.dump() << std::endl;
        } else {
            std::cout << create_error_response(id, -32601, "Method not found: " + method).dump() << std::endl;
        }
    }

    return 0;
}
