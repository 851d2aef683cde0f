#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Integration
// ═══════════════════════════════════════════════════════════════════════════
// Host-facing layer over ClientManager.
//
// - Keeps a flattened bare-name tool registry. When two servers expose the
//   same name, the first server in configured order owns the entry; every
//   entry remembers its qualified id, so dispatch is unambiguous.
// - Relays manager events to host handlers as HostEvents.
// - Records every call_tool() in a bounded in-memory log.
// - refresh() tears the manager down and initializes it again. Calls made
//   while a refresh runs are rejected with Busy; a second concurrent
//   refresh returns false.
//
// The priority list only filters what get_high_priority_tools() shows. It
// never takes part in dispatch.

#include "mcphub/client/client_manager.hpp"
#include "mcphub/config/hub_config.hpp"

#include <asio/awaitable.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// Host Events
// ─────────────────────────────────────────────────────────────────────────────

enum class HostEventKind {
    ToolsUpdated,
    ServerError,
    ServerDisconnected
};

[[nodiscard]] constexpr std::string_view to_string(HostEventKind kind) noexcept {
    switch (kind) {
        case HostEventKind::ToolsUpdated:       return "tools-updated";
        case HostEventKind::ServerError:        return "server-error";
        case HostEventKind::ServerDisconnected: return "server-disconnected";
    }
    return "unknown";
}

struct HostEvent {
    HostEventKind kind;
    std::string server_id;
    std::string message;
    std::size_t tool_count{0};  // ToolsUpdated only
};

using HostEventHandler = std::function<void(const HostEvent&)>;

// ─────────────────────────────────────────────────────────────────────────────
// Registry & Call Log
// ─────────────────────────────────────────────────────────────────────────────

struct RegisteredTool {
    std::string name;          // registry key
    std::string qualified_id;  // dispatch target
    std::string server_id;
    std::optional<std::string> description;
    Json input_schema;

    [[nodiscard]] Json to_json() const;
};

struct ToolCallRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string tool;
    std::string arguments;  // serialized JSON
    bool success{false};
    std::optional<std::string> error;
    std::size_t result_size{0};  // bytes of serialized result
    std::chrono::milliseconds duration{0};

    [[nodiscard]] Json to_json() const;
};

struct IntegrationStats {
    bool initialized{false};
    std::size_t server_count{0};
    std::size_t connected_servers{0};
    std::size_t tool_count{0};  // registry entries
    std::size_t resource_count{0};
    std::size_t prompt_count{0};
    std::uint64_t total_calls{0};
    std::uint64_t failed_calls{0};
    std::vector<ServerStatus> servers;

    [[nodiscard]] Json to_json() const;
};

struct IntegrationOptions {
    std::size_t call_log_capacity{1000};
    std::vector<std::string> priority_servers{default_priority_servers()};
};

// ═══════════════════════════════════════════════════════════════════════════
// Integration
// ═══════════════════════════════════════════════════════════════════════════

class Integration : public std::enable_shared_from_this<Integration> {
public:
    using HandlerId = std::uint64_t;

    [[nodiscard]] static std::shared_ptr<Integration> create(
        std::shared_ptr<ClientManager> manager,
        IntegrationOptions options = {}
    );

    ~Integration();

    Integration(const Integration&) = delete;
    Integration& operator=(const Integration&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::awaitable<void> initialize();
    [[nodiscard]] asio::awaitable<void> shutdown();

    /// Shutdown + initialize. False if another refresh is already running.
    [[nodiscard]] asio::awaitable<bool> refresh();

    [[nodiscard]] bool is_initialized() const noexcept { return initialized_.load(); }
    [[nodiscard]] bool is_refreshing() const noexcept { return refreshing_.load(); }

    // ─────────────────────────────────────────────────────────────────────────
    // Invocation
    // ─────────────────────────────────────────────────────────────────────────

    /// Qualified id or bare name, resolved by the manager. Logged.
    [[nodiscard]] asio::awaitable<ClientResult<Json>> call_tool(std::string name, Json arguments);

    /// Registry lookup only; dispatches to the entry's qualified id.
    [[nodiscard]] asio::awaitable<ClientResult<Json>> execute_tool(std::string name, Json arguments);

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<RegisteredTool> get_tools() const;
    [[nodiscard]] std::optional<RegisteredTool> get_tool(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> get_tool_names() const;
    [[nodiscard]] bool has_tool(std::string_view name) const;

    /// Registry entries owned by a priority server, registry order.
    [[nodiscard]] std::vector<RegisteredTool> get_high_priority_tools() const;

    [[nodiscard]] std::vector<ResourceDescriptor> get_resources() const;
    [[nodiscard]] std::vector<ServerStatus> get_server_status() const;
    [[nodiscard]] IntegrationStats get_stats() const;

    /// Oldest first.
    [[nodiscard]] std::vector<ToolCallRecord> call_log() const;

    [[nodiscard]] const std::shared_ptr<ClientManager>& manager() const noexcept { return manager_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Events
    // ─────────────────────────────────────────────────────────────────────────

    HandlerId on_event(HostEventHandler handler);
    void remove_handler(HandlerId id);

private:
    Integration(std::shared_ptr<ClientManager> manager, IntegrationOptions options);

    void handle_manager_event(const ManagerEvent& event);
    void rebuild_registry();
    void record_call(const std::string& tool,
                     const Json& arguments,
                     const ClientResult<Json>& result,
                     std::chrono::steady_clock::time_point started);
    void emit(const HostEvent& event);

    std::shared_ptr<ClientManager> manager_;
    IntegrationOptions options_;
    ClientManager::ListenerId listener_id_{0};

    std::atomic<bool> initialized_{false};
    std::atomic<bool> refreshing_{false};

    mutable std::mutex registry_mutex_;
    std::vector<RegisteredTool> registry_;
    std::unordered_map<std::string, std::size_t> registry_index_;

    mutable std::mutex log_mutex_;
    std::deque<ToolCallRecord> call_log_;
    std::uint64_t total_calls_{0};
    std::uint64_t failed_calls_{0};

    mutable std::mutex handler_mutex_;
    std::map<HandlerId, HostEventHandler> handlers_;
    HandlerId next_handler_id_{0};
};

}  // namespace mcphub
