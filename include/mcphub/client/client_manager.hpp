#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Manager
// ═══════════════════════════════════════════════════════════════════════════
// Owns one ServerConnection per configured server and presents them as a
// single catalog and invocation surface.
//
//   auto manager = ClientManager::create(io.get_executor(), config.servers, options);
//   co_await manager->initialize();
//   auto tools = manager->get_available_tools();
//   auto result = co_await manager->call_tool("files/read", {{"path", "/tmp/x"}});
//   co_await manager->shutdown();
//
// initialize() connects every server concurrently and waits for all of the
// attempts to settle. A server that fails to start or to initialize is
// recorded and reported through a ServerError event; the others carry on.
//
// The merged catalog is an immutable CatalogSnapshot. Each discovery pass
// builds a new one and swaps it in, so readers holding the old pointer keep
// a consistent view.
//
// Name resolution for call_tool/read_resource/get_prompt:
//   1. exact qualified id ("server/name")
//   2. first bare-name match, scanning servers in configured order

#include "mcphub/client/catalog.hpp"
#include "mcphub/client/client_error.hpp"
#include "mcphub/client/server_connection.hpp"
#include "mcphub/config/hub_config.hpp"
#include "mcphub/transport/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// Events
// ─────────────────────────────────────────────────────────────────────────────

enum class ManagerEventKind {
    Initialized,         // initialize() settled
    ServerError,         // a server failed to start, initialize or reconnect
    ServerDisconnected,  // a Connected server's transport ended
    ServerMessage,       // notification other than list_changed
    RegistryChanged      // a new snapshot with different content was published
};

[[nodiscard]] constexpr std::string_view to_string(ManagerEventKind kind) noexcept {
    switch (kind) {
        case ManagerEventKind::Initialized:        return "initialized";
        case ManagerEventKind::ServerError:        return "server-error";
        case ManagerEventKind::ServerDisconnected: return "server-disconnected";
        case ManagerEventKind::ServerMessage:      return "server-message";
        case ManagerEventKind::RegistryChanged:    return "registry-changed";
    }
    return "unknown";
}

struct ManagerEvent {
    ManagerEventKind kind;
    std::string server_id;  // empty for Initialized / RegistryChanged
    std::string message;    // error text or disconnect reason
    std::string method;     // ServerMessage only
    Json params;            // ServerMessage only
};

using ManagerListener = std::function<void(const ManagerEvent&)>;

// ─────────────────────────────────────────────────────────────────────────────
// Status
// ─────────────────────────────────────────────────────────────────────────────

struct ServerStatus {
    std::string id;
    TransportKind kind{TransportKind::Process};
    ConnectionState state{ConnectionState::Disconnected};
    bool connected{false};
    std::size_t tool_count{0};
    std::size_t resource_count{0};
    std::size_t prompt_count{0};
    std::optional<std::string> last_error;
    std::string endpoint;

    [[nodiscard]] Json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Options
// ─────────────────────────────────────────────────────────────────────────────

using TransportFactory = std::function<
    ClientResult<std::unique_ptr<ITransport>>(asio::any_io_executor, const ServerConfig&)
>;

/// ProcessTransport for process entries, RemoteTransport for remote ones.
[[nodiscard]] TransportFactory make_default_transport_factory(
    std::chrono::milliseconds shutdown_grace = std::chrono::seconds(2));

struct ManagerOptions {
    std::string client_name = "mcphub";
    std::string client_version = "0.1.0";
    std::size_t max_list_pages = 64;

    /// Defaults to make_default_transport_factory().
    TransportFactory transport_factory;

    [[nodiscard]] static ManagerOptions from_settings(const HubSettings& settings);
};

// ═══════════════════════════════════════════════════════════════════════════
// ClientManager
// ═══════════════════════════════════════════════════════════════════════════

class ClientManager : public std::enable_shared_from_this<ClientManager> {
public:
    using ListenerId = std::uint64_t;

    [[nodiscard]] static std::shared_ptr<ClientManager> create(
        asio::any_io_executor executor,
        std::vector<ServerConfig> servers,
        ManagerOptions options = {}
    );

    ClientManager(const ClientManager&) = delete;
    ClientManager& operator=(const ClientManager&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Connect and discover every server; never fails as a whole.
    /// No-op while already running or starting.
    [[nodiscard]] asio::awaitable<void> initialize();

    /// Disconnect every server concurrently and clear the catalog. In-flight
    /// calls fail with ServerUnavailable. Idempotent; initialize() may be
    /// called again afterwards.
    [[nodiscard]] asio::awaitable<void> shutdown();

    /// Drop the server's current connection and make one fresh attempt.
    [[nodiscard]] asio::awaitable<ClientResult<void>> reconnect(std::string server_id);

    [[nodiscard]] bool is_running() const noexcept;

    // ─────────────────────────────────────────────────────────────────────────
    // Invocation
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::awaitable<ClientResult<Json>> call_tool(std::string name, Json arguments);
    [[nodiscard]] asio::awaitable<ClientResult<Json>> read_resource(std::string uri);
    [[nodiscard]] asio::awaitable<ClientResult<Json>> get_prompt(std::string name, Json arguments);

    // ─────────────────────────────────────────────────────────────────────────
    // Catalog & Status
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::shared_ptr<const CatalogSnapshot> snapshot() const;

    [[nodiscard]] std::vector<ToolDescriptor> get_available_tools() const;
    [[nodiscard]] std::vector<ResourceDescriptor> get_available_resources() const;
    [[nodiscard]] std::vector<PromptDescriptor> get_available_prompts() const;

    /// Configured order.
    [[nodiscard]] std::vector<ServerStatus> get_server_status() const;

    [[nodiscard]] std::shared_ptr<ServerConnection> connection(std::string_view server_id) const;

    [[nodiscard]] const std::vector<ServerConfig>& servers() const noexcept { return configs_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Events
    // ─────────────────────────────────────────────────────────────────────────

    ListenerId add_listener(ManagerListener listener);
    void remove_listener(ListenerId id);

private:
    enum class Lifecycle : std::uint8_t { Idle, Starting, Running, Stopping };

    struct ServerEntry {
        ServerConfig config;
        std::shared_ptr<ServerConnection> connection;

        /// State reported once the connection has been released.
        ConnectionState released_state{ConnectionState::Disconnected};
        ServerCatalog catalog;
        std::optional<std::string> last_error;
        bool reconnecting{false};
    };

    ClientManager(asio::any_io_executor executor, std::vector<ServerConfig> servers, ManagerOptions options);

    asio::awaitable<void> connect_server(std::size_t index, std::uint64_t epoch);
    asio::awaitable<ServerCatalog> discover(std::shared_ptr<ServerConnection> connection);
    asio::awaitable<void> discover_tools(std::shared_ptr<ServerConnection> connection,
                                         std::shared_ptr<ServerCatalog> catalog);
    asio::awaitable<void> discover_resources(std::shared_ptr<ServerConnection> connection,
                                             std::shared_ptr<ServerCatalog> catalog);
    asio::awaitable<void> discover_prompts(std::shared_ptr<ServerConnection> connection,
                                           std::shared_ptr<ServerCatalog> catalog);
    asio::awaitable<void> rediscover(std::shared_ptr<ClientManager> self,
                                     std::string server_id,
                                     std::shared_ptr<ServerConnection> connection);

    void wire_handlers(const std::shared_ptr<ServerConnection>& connection);
    void record_failure(std::size_t index,
                        const std::shared_ptr<ServerConnection>& connection,
                        const ClientError& error);
    void handle_notification(const std::string& server_id,
                             const std::weak_ptr<ServerConnection>& source,
                             const std::string& method,
                             const Json& params);
    void handle_closed(const std::string& server_id,
                       const std::weak_ptr<ServerConnection>& source,
                       const std::string& reason);

    /// Rebuild the snapshot from the entries; true when the content changed.
    bool publish();
    void emit(const ManagerEvent& event);

    [[nodiscard]] std::optional<std::size_t> index_of(std::string_view server_id) const;

    asio::any_io_executor executor_;
    ManagerOptions options_;
    const std::vector<ServerConfig> configs_;

    std::atomic<Lifecycle> lifecycle_{Lifecycle::Idle};

    mutable std::mutex entries_mutex_;
    std::vector<ServerEntry> entries_;  // configured order
    std::uint64_t epoch_{0};            // bumped by shutdown()

    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const CatalogSnapshot> snapshot_;

    mutable std::mutex listener_mutex_;
    std::map<ListenerId, ManagerListener> listeners_;
    ListenerId next_listener_id_{0};
};

}  // namespace mcphub
