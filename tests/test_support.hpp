#ifndef MCPHUB_TESTS_TEST_SUPPORT_HPP
#define MCPHUB_TESTS_TEST_SUPPORT_HPP

// ─────────────────────────────────────────────────────────────────────────────
// Shared test helpers
// ─────────────────────────────────────────────────────────────────────────────

#include "mcphub/config/hub_config.hpp"
#include "mcphub/protocol/mcp_types.hpp"
#include "mocks/mock_transport.hpp"

#include <asio/co_spawn.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/use_future.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <string>
#include <thread>
#include <vector>

#ifndef MCPHUB_FAKE_SERVER_PATH
#error "MCPHUB_FAKE_SERVER_PATH must point at the fake_mcp_server executable"
#endif

namespace mcphub::testing {

// ═══════════════════════════════════════════════════════════════════════════
// Event loop
// ═══════════════════════════════════════════════════════════════════════════

// io_context on a background thread; tests block on the returned futures.
class TestLoop {
public:
    TestLoop()
        : work_(asio::make_work_guard(io_))
        , thread_([this] { io_.run(); })
    {}

    ~TestLoop() {
        work_.reset();
        io_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    TestLoop(const TestLoop&) = delete;
    TestLoop& operator=(const TestLoop&) = delete;

    asio::any_io_executor executor() { return io_.get_executor(); }

    template <typename T>
    T run(asio::awaitable<T> task) {
        return asio::co_spawn(io_, std::move(task), asio::use_future).get();
    }

    template <typename T>
    std::future<T> start(asio::awaitable<T> task) {
        return asio::co_spawn(io_, std::move(task), asio::use_future);
    }

private:
    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    std::thread thread_;
};

inline bool wait_until(const std::function<bool()>& condition,
                       std::chrono::milliseconds limit = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

// ═══════════════════════════════════════════════════════════════════════════
// Fake servers
// ═══════════════════════════════════════════════════════════════════════════

inline ServerConfig fake_process_server(std::string id, std::vector<std::string> args = {}) {
    ServerConfig config;
    config.id = std::move(id);
    config.kind = TransportKind::Process;
    config.command = MCPHUB_FAKE_SERVER_PATH;
    config.args = std::move(args);
    return config;
}

inline Json reply_to(const Json& request, Json result) {
    return Json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", std::move(result)}};
}

inline Json error_reply_to(const Json& request, int code, std::string message) {
    return Json{{"jsonrpc", "2.0"}, {"id", request["id"]},
                {"error", {{"code", code}, {"message", std::move(message)}}}};
}

inline Tool make_tool(std::string name, std::string description = "") {
    Tool tool;
    tool.name = std::move(name);
    if (description.empty() == false) {
        tool.description = std::move(description);
    }
    tool.input_schema = Json{{"type", "object"}};
    return tool;
}

// In-memory MCP server behind a MockTransport.
struct ScriptedServer {
    std::string name = "scripted";
    std::vector<Tool> tools;
    std::vector<Resource> resources;
    std::vector<Prompt> prompts;
    bool answer_initialize = true;
    bool answer_calls = true;

    [[nodiscard]] MockTransport::Responder responder() const {
        auto script = *this;
        return [script](const Json& sent) -> std::vector<Json> {
            if (sent.contains("id") == false) {
                return {};
            }
            const auto method = sent.value("method", "");

            if (method == "initialize") {
                if (script.answer_initialize == false) {
                    return {};
                }
                return {reply_to(sent, {
                    {"protocolVersion", MCP_PROTOCOL_VERSION},
                    {"capabilities", {{"tools", {{"listChanged", true}}}}},
                    {"serverInfo", {{"name", script.name}, {"version", "1.0"}}}
                })};
            }
            if (method == "tools/list") {
                Json tools = Json::array();
                for (const auto& tool : script.tools) {
                    tools.push_back(tool.to_json());
                }
                return {reply_to(sent, {{"tools", tools}})};
            }
            if (method == "resources/list") {
                Json resources = Json::array();
                for (const auto& resource : script.resources) {
                    resources.push_back(resource.to_json());
                }
                return {reply_to(sent, {{"resources", resources}})};
            }
            if (method == "prompts/list") {
                Json prompts = Json::array();
                for (const auto& prompt : script.prompts) {
                    prompts.push_back(prompt.to_json());
                }
                return {reply_to(sent, {{"prompts", prompts}})};
            }
            if (method == "tools/call") {
                if (script.answer_calls == false) {
                    return {};
                }
                const auto& params = sent["params"];
                return {reply_to(sent, {
                    {"content", Json::array({{{"type", "text"},
                                              {"text", script.name + ":" + params.value("name", "")}}})},
                    {"isError", false}
                })};
            }
            if (method == "resources/read") {
                return {reply_to(sent, {{"contents", Json::array({{{"uri", sent["params"].value("uri", "")},
                                                                   {"text", script.name}}})}})};
            }
            if (method == "prompts/get") {
                return {reply_to(sent, {{"messages", Json::array()}, {"description", script.name}})};
            }
            return {error_reply_to(sent, -32601, "Method not found: " + method)};
        };
    }
};

}  // namespace mcphub::testing

#endif  // MCPHUB_TESTS_TEST_SUPPORT_HPP
