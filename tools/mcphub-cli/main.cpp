// ─────────────────────────────────────────────────────────────────────────────
// mcphub-cli - Multi-server MCP host
// ─────────────────────────────────────────────────────────────────────────────
// Loads an mcpServers configuration, connects every server and exposes the
// merged catalog from the command line.
//
// Usage:
//   mcphub-cli --config servers.json --status
//   mcphub-cli --config servers.json --list-tools --priority
//   mcphub-cli --config servers.json --call files/read_file --args '{"path":"/tmp/x"}'
//   mcphub-cli --config servers.json --call read_file --events --json

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "mcphub/client/client_manager.hpp"
#include "mcphub/config/hub_config.hpp"
#include "mcphub/integration/integration.hpp"
#include "mcphub/log/spdlog_logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/use_future.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace mcphub;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j) {
    std::cout << j.dump(2) << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Event Loop
// ═══════════════════════════════════════════════════════════════════════════

// Runs an io_context on a background thread; the CLI blocks on futures.
class EventLoop {
public:
    EventLoop()
        : work_(asio::make_work_guard(io_))
        , thread_([this] { io_.run(); })
    {}

    ~EventLoop() {
        work_.reset();
        io_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    asio::any_io_executor executor() { return io_.get_executor(); }

    template <typename T>
    T run(asio::awaitable<T> task) {
        return asio::co_spawn(io_, std::move(task), asio::use_future).get();
    }

private:
    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    std::thread thread_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

int cmd_list_tools(Integration& integration, bool priority_only, bool json_output) {
    const auto tools = priority_only ? integration.get_high_priority_tools() : integration.get_tools();

    if (json_output) {
        Json output = Json::array();
        for (const auto& tool : tools) {
            output.push_back(tool.to_json());
        }
        print_json(output);
        return 0;
    }

    print_header(priority_only ? "Priority Tools" : "Tools");
    if (tools.empty()) {
        std::cout << color::c(color::dim) << "(no tools available)" << color::c(color::reset) << "\n";
        return 0;
    }
    for (const auto& tool : tools) {
        std::cout << color::c(color::bold) << color::c(color::yellow)
                  << "• " << tool.name << color::c(color::reset)
                  << color::c(color::dim) << "  (" << tool.qualified_id << ")" << color::c(color::reset);
        if (tool.description) {
            std::cout << "\n  " << color::c(color::dim) << *tool.description << color::c(color::reset);
        }
        std::cout << "\n\n";
    }
    return 0;
}

int cmd_list_resources(Integration& integration, bool json_output) {
    const auto resources = integration.get_resources();

    if (json_output) {
        Json output = Json::array();
        for (const auto& resource : resources) {
            output.push_back(resource.to_json());
        }
        print_json(output);
        return 0;
    }

    print_header("Resources");
    if (resources.empty()) {
        std::cout << color::c(color::dim) << "(no resources available)" << color::c(color::reset) << "\n";
        return 0;
    }
    for (const auto& descriptor : resources) {
        std::cout << color::c(color::bold) << "• " << descriptor.resource.name << color::c(color::reset)
                  << "\n  " << color::c(color::cyan) << descriptor.qualified_id() << color::c(color::reset);
        if (descriptor.resource.mime_type) {
            std::cout << color::c(color::dim) << " [" << *descriptor.resource.mime_type << "]"
                      << color::c(color::reset);
        }
        std::cout << "\n\n";
    }
    return 0;
}

int cmd_status(Integration& integration, bool json_output) {
    const auto statuses = integration.get_server_status();

    if (json_output) {
        Json output = Json::array();
        for (const auto& status : statuses) {
            output.push_back(status.to_json());
        }
        print_json(output);
        return 0;
    }

    print_header("Servers");
    for (const auto& status : statuses) {
        const char* marker = status.connected ? color::green : color::red;
        std::cout << color::c(marker) << (status.connected ? "● " : "○ ") << color::c(color::reset)
                  << color::c(color::bold) << status.id << color::c(color::reset)
                  << "  " << to_string(status.kind) << ", " << to_string(status.state)
                  << ", " << status.tool_count << " tools, " << status.resource_count << " resources, "
                  << status.prompt_count << " prompts\n"
                  << "  " << color::c(color::dim) << status.endpoint << color::c(color::reset) << "\n";
        if (status.last_error) {
            std::cout << "  " << color::c(color::red) << *status.last_error << color::c(color::reset) << "\n";
        }
    }
    return 0;
}

int cmd_stats(Integration& integration, bool json_output) {
    const auto stats = integration.get_stats();

    if (json_output) {
        print_json(stats.to_json());
        return 0;
    }

    print_header("Statistics");
    std::cout << "  Servers:   " << stats.connected_servers << "/" << stats.server_count << " connected\n"
              << "  Tools:     " << stats.tool_count << "\n"
              << "  Resources: " << stats.resource_count << "\n"
              << "  Prompts:   " << stats.prompt_count << "\n"
              << "  Calls:     " << stats.total_calls << " (" << stats.failed_calls << " failed)\n";
    return 0;
}

int cmd_call_tool(EventLoop& loop, Integration& integration, const std::string& name,
                  const std::string& args_json, bool json_output) {
    Json args;
    try {
        args = Json::parse(args_json);
    } catch (const Json::parse_error& e) {
        print_error("Invalid JSON arguments: " + std::string(e.what()));
        return 1;
    }

    auto result = loop.run(integration.call_tool(name, std::move(args)));
    if (!result) {
        print_error(result.error().describe());
        return 1;
    }

    if (json_output) {
        print_json(*result);
        return 0;
    }

    print_header("Result: " + name);
    if (const auto content = result->find("content"); content != result->end() && content->is_array()) {
        for (const auto& item : *content) {
            if (item.value("type", "") == "text") {
                std::cout << item.value("text", "") << "\n";
            } else {
                print_json(item);
            }
        }
    } else {
        print_json(*result);
    }
    if (result->value("isError", false)) {
        std::cout << color::c(color::red) << "(tool reported an error)" << color::c(color::reset) << "\n";
        return 1;
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcphub-cli", "Multi-server MCP host");

    options.add_options()
        ("c,config", "Server configuration file (mcpServers JSON)", cxxopts::value<std::string>())

        // Commands
        ("list-tools", "List registered tools (bare names)")
        ("list-resources", "List resources from every server")
        ("status", "Show per-server status")
        ("stats", "Show aggregate statistics")
        ("call", "Call a tool by qualified id or bare name", cxxopts::value<std::string>())
        ("args", "JSON arguments for --call", cxxopts::value<std::string>()->default_value("{}"))
        ("refresh", "Reconnect every server before running the command")
        ("priority", "With --list-tools, only tools of priority servers")
        ("events", "Print host events as they arrive")

        // Output and logging
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("log-level", "trace, debug, info, warn, error or off", cxxopts::value<std::string>())
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        if (result.count("config") == 0) {
            print_error("--config is required");
            std::cout << "\n" << options.help() << "\n";
            return 1;
        }

        auto config = load_hub_config(result["config"].as<std::string>());
        if (!config) {
            print_error(config.error().message);
            return 1;
        }

        auto level = config->settings.log_level;
        if (result.count("log-level")) {
            const auto parsed = parse_log_level(result["log-level"].as<std::string>());
            if (!parsed) {
                print_error("Unknown log level: " + result["log-level"].as<std::string>());
                return 1;
            }
            level = *parsed;
        }
        const std::string log_file = result.count("log-file")
            ? result["log-file"].as<std::string>()
            : config->settings.log_file;
        set_logger(make_spdlog_console_file_logger(log_file, level));

        for (const auto& issue : config->issues) {
            print_error((issue.server_id.empty() ? "" : "[" + issue.server_id + "] ") + issue.message);
        }

        EventLoop loop;

        auto manager = ClientManager::create(
            loop.executor(), config->servers, ManagerOptions::from_settings(config->settings));

        IntegrationOptions integration_options;
        integration_options.call_log_capacity = config->settings.call_log_capacity;
        integration_options.priority_servers = config->priority_servers;
        auto integration = Integration::create(manager, std::move(integration_options));

        if (result.count("events")) {
            integration->on_event([](const HostEvent& event) {
                std::cerr << color::c(color::dim) << "[event] " << to_string(event.kind);
                if (event.server_id.empty() == false) {
                    std::cerr << " " << event.server_id;
                }
                if (event.kind == HostEventKind::ToolsUpdated) {
                    std::cerr << " (" << event.tool_count << " tools)";
                } else if (event.message.empty() == false) {
                    std::cerr << ": " << event.message;
                }
                std::cerr << color::c(color::reset) << "\n";
            });
        }

        loop.run(integration->initialize());

        if (result.count("refresh")) {
            if (loop.run(integration->refresh()) == false) {
                print_error("Refresh rejected");
            }
        }

        int exit_code = 0;
        if (result.count("call")) {
            exit_code = cmd_call_tool(loop, *integration, result["call"].as<std::string>(),
                                      result["args"].as<std::string>(), json_output);
        } else if (result.count("list-tools")) {
            exit_code = cmd_list_tools(*integration, result.count("priority") > 0, json_output);
        } else if (result.count("list-resources")) {
            exit_code = cmd_list_resources(*integration, json_output);
        } else if (result.count("stats")) {
            exit_code = cmd_stats(*integration, json_output);
        } else {
            exit_code = cmd_status(*integration, json_output);
        }

        loop.run(integration->shutdown());
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const std::exception& e) {
        print_error(e.what());
        return 1;
    }
}
