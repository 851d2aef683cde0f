// ─────────────────────────────────────────────────────────────────────────────
// fake_mcp_server - scripted MCP server for process transport tests
// ─────────────────────────────────────────────────────────────────────────────
// Speaks newline-delimited JSON-RPC on stdin/stdout. Behaviour is chosen
// with flags:
//
//   --exit-code N        exit with N before reading anything
//   --name NAME          serverInfo.name (default "fake")
//   --tool NAME          expose a tool (repeatable, default "echo")
//   --resource URI       expose a resource (repeatable)
//   --page-size N        paginate tools/list with nextCursor
//   --never-reply        read requests, answer nothing
//   --malformed          write a garbage line before every reply
//   --notify METHOD      send METHOD as a notification after initialized
//   --ping               send a ping request after initialized
//   --reply-delay-ms N   delay tools/call replies by N ms
//   --no-prompts         answer prompts/list with -32601
//   --stderr TEXT        write TEXT to stderr at startup
//   --record PATH        append every received line to PATH
//
// A tools/call is answered with the "text" argument echoed back, or with
// the serialized arguments when there is no "text".

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using Json = nlohmann::json;

namespace {

struct Options {
    std::optional<int> exit_code;
    std::string name = "fake";
    std::vector<std::string> tools;
    std::vector<std::string> resources;
    std::size_t page_size = 0;
    bool never_reply = false;
    bool malformed = false;
    std::vector<std::string> notify;
    bool ping = false;
    int reply_delay_ms = 0;
    bool no_prompts = false;
    std::string stderr_text;
    std::string record_path;
};

Options parse_options(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            return (i + 1 < argc) ? argv[++i] : "";
        };

        if (arg == "--exit-code") options.exit_code = std::atoi(next().c_str());
        else if (arg == "--name") options.name = next();
        else if (arg == "--tool") options.tools.push_back(next());
        else if (arg == "--resource") options.resources.push_back(next());
        else if (arg == "--page-size") options.page_size = static_cast<std::size_t>(std::atoi(next().c_str()));
        else if (arg == "--never-reply") options.never_reply = true;
        else if (arg == "--malformed") options.malformed = true;
        else if (arg == "--notify") options.notify.push_back(next());
        else if (arg == "--ping") options.ping = true;
        else if (arg == "--reply-delay-ms") options.reply_delay_ms = std::atoi(next().c_str());
        else if (arg == "--no-prompts") options.no_prompts = true;
        else if (arg == "--stderr") options.stderr_text = next();
        else if (arg == "--record") options.record_path = next();
    }
    if (options.tools.empty()) {
        options.tools.push_back("echo");
    }
    return options;
}

void write_line(const Options& options, const Json& message) {
    if (options.malformed) {
        std::cout << "{this is not json\n";
    }
    std::cout << message.dump() << "\n" << std::flush;
}

Json result_for(const Json& id, Json result) {
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

Json error_for(const Json& id, int code, const std::string& message) {
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

Json tool_json(const std::string& name) {
    return Json{
        {"name", name},
        {"description", "Fake tool " + name},
        {"inputSchema", {{"type", "object"}, {"properties", {{"text", {{"type", "string"}}}}}}}
    };
}

Json list_tools(const Options& options, const Json& params) {
    std::size_t start = 0;
    if (params.is_object() && params.contains("cursor")) {
        start = static_cast<std::size_t>(std::atoi(params["cursor"].get<std::string>().c_str()));
    }
    const std::size_t count = options.page_size > 0 ? options.page_size : options.tools.size();

    Json tools = Json::array();
    std::size_t i = start;
    for (; i < options.tools.size() && i < start + count; ++i) {
        tools.push_back(tool_json(options.tools[i]));
    }

    Json result = {{"tools", tools}};
    if (i < options.tools.size()) {
        result["nextCursor"] = std::to_string(i);
    }
    return result;
}

Json call_tool(const Json& params) {
    const auto name = params.value("name", "");
    const auto arguments = params.value("arguments", Json::object());

    std::string text;
    if (arguments.contains("text") && arguments["text"].is_string()) {
        text = arguments["text"].get<std::string>();
    } else {
        text = name + ":" + arguments.dump();
    }
    return Json{
        {"content", Json::array({{{"type", "text"}, {"text", text}}})},
        {"isError", false}
    };
}

}  // namespace

int main(int argc, char* argv[]) {
    const auto options = parse_options(argc, argv);

    if (options.stderr_text.empty() == false) {
        std::cerr << options.stderr_text << std::endl;
    }
    if (options.exit_code) {
        return *options.exit_code;
    }

    std::ofstream record;
    if (options.record_path.empty() == false) {
        record.open(options.record_path, std::ios::app);
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (record.is_open()) {
            record << line << "\n" << std::flush;
        }

        Json message;
        try {
            message = Json::parse(line);
        } catch (const Json::parse_error&) {
            continue;
        }
        if (options.never_reply) {
            continue;
        }

        const auto method = message.value("method", "");
        const bool is_request = message.contains("id") && message.contains("method");
        const Json params = message.value("params", Json::object());

        if (method == "notifications/initialized") {
            for (const auto& notification : options.notify) {
                write_line(options, Json{{"jsonrpc", "2.0"}, {"method", notification}, {"params", Json::object()}});
            }
            if (options.ping) {
                write_line(options, Json{{"jsonrpc", "2.0"}, {"id", "srv-1"}, {"method", "ping"}});
            }
            continue;
        }
        if (is_request == false) {
            continue;  // responses to our ping, other notifications
        }

        const auto& id = message["id"];
        if (method == "initialize") {
            write_line(options, result_for(id, {
                {"protocolVersion", "2024-11-05"},
                {"capabilities", {{"tools", {{"listChanged", true}}}, {"resources", Json::object()}}},
                {"serverInfo", {{"name", options.name}, {"version", "1.0.0"}}}
            }));
        } else if (method == "tools/list") {
            write_line(options, result_for(id, list_tools(options, params)));
        } else if (method == "tools/call") {
            if (options.reply_delay_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(options.reply_delay_ms));
            }
            write_line(options, result_for(id, call_tool(params)));
        } else if (method == "resources/list") {
            Json resources = Json::array();
            for (const auto& uri : options.resources) {
                resources.push_back({{"uri", uri}, {"name", uri}, {"mimeType", "text/plain"}});
            }
            write_line(options, result_for(id, {{"resources", resources}}));
        } else if (method == "resources/read") {
            const auto uri = params.value("uri", "");
            write_line(options, result_for(id, {
                {"contents", Json::array({{{"uri", uri}, {"mimeType", "text/plain"}, {"text", "contents of " + uri}}})}
            }));
        } else if (method == "prompts/list" && options.no_prompts == false) {
            write_line(options, result_for(id, {{"prompts", Json::array()}}));
        } else if (method == "ping") {
            write_line(options, result_for(id, Json::object()));
        } else {
            write_line(options, error_for(id, -32601, "Method not found: " + method));
        }
    }
    return 0;
}
