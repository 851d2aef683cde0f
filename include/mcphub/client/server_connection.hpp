#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Connection
// ═══════════════════════════════════════════════════════════════════════════
// One transport plus connection state, negotiated capabilities and the
// pending-request table.
//
//   auto conn = ServerConnection::create("files", std::move(transport), options);
//   auto init = co_await conn->connect();
//   auto tools = co_await conn->list_tools();
//   auto result = co_await conn->call_tool("read", {{"path", "/tmp/x"}});
//   co_await conn->disconnect();
//
// All connection state lives on a private strand; every public coroutine
// hops onto it, so callers may use any executor and any thread.
//
// Each request gets its own id, single-slot reply channel and timer. The
// first of {reply, timeout, transport failure, disconnect} removes the
// entry and resolves the caller; anything arriving afterwards for that id
// finds no entry and is dropped.
//
// connect() is one-shot. A fresh attempt needs a new ServerConnection.

#include "mcphub/client/client_error.hpp"
#include "mcphub/protocol/json_rpc.hpp"
#include "mcphub/protocol/mcp_types.hpp"
#include "mcphub/transport/transport.hpp"

#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mcphub {

enum class ConnectionState : std::uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Failed:       return "failed";
    }
    return "unknown";
}

struct ConnectionOptions {
    std::string client_name = "mcphub";
    std::string client_version = "0.1.0";

    /// Per-request deadline (0 = none).
    std::chrono::milliseconds request_timeout{std::chrono::seconds(300)};

    /// Upper bound on nextCursor pages followed by a single listing.
    std::size_t max_list_pages = 64;

    ClientCapabilities capabilities{};
};

class ServerConnection : public std::enable_shared_from_this<ServerConnection> {
public:
    using NotificationHandler = std::function<void(const std::string& method, const Json& params)>;
    using ClosedHandler = std::function<void(const std::string& reason)>;

    [[nodiscard]] static std::shared_ptr<ServerConnection> create(
        std::string id,
        std::unique_ptr<ITransport> transport,
        ConnectionOptions options = {}
    );

    ~ServerConnection();

    ServerConnection(const ServerConnection&) = delete;
    ServerConnection& operator=(const ServerConnection&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Start the transport, run the initialize handshake and send
    /// notifications/initialized. Failed on any error.
    [[nodiscard]] asio::awaitable<ClientResult<InitializeResult>> connect();

    /// Fail every pending call with ServerUnavailable and stop the transport.
    /// Idempotent.
    [[nodiscard]] asio::awaitable<void> disconnect();

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────

    /// Raw JSON-RPC request; yields the `result` member.
    [[nodiscard]] asio::awaitable<ClientResult<Json>> request(
        std::string method,
        Json params = Json::object()
    );

    [[nodiscard]] asio::awaitable<ClientResult<void>> notify(
        std::string method,
        Json params = Json::object()
    );

    // Listings follow nextCursor up to max_list_pages.
    [[nodiscard]] asio::awaitable<ClientResult<std::vector<Tool>>> list_tools();
    [[nodiscard]] asio::awaitable<ClientResult<std::vector<Resource>>> list_resources();
    [[nodiscard]] asio::awaitable<ClientResult<std::vector<Prompt>>> list_prompts();

    [[nodiscard]] asio::awaitable<ClientResult<Json>> call_tool(std::string name, Json arguments);
    [[nodiscard]] asio::awaitable<ClientResult<Json>> read_resource(std::string uri);
    [[nodiscard]] asio::awaitable<ClientResult<Json>> get_prompt(std::string name, Json arguments);

    // ─────────────────────────────────────────────────────────────────────────
    // State
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] ConnectionState state() const noexcept { return state_.load(); }
    [[nodiscard]] bool is_connected() const noexcept { return state() == ConnectionState::Connected; }
    [[nodiscard]] std::size_t pending_count() const noexcept { return pending_size_.load(); }
    [[nodiscard]] std::string endpoint() const { return transport_->describe(); }

    [[nodiscard]] std::optional<Implementation> server_info() const;
    [[nodiscard]] std::optional<ServerCapabilities> server_capabilities() const;

    /// Reason of the most recent failure (connect error or stream end).
    [[nodiscard]] std::optional<std::string> last_error() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Events
    // ─────────────────────────────────────────────────────────────────────────

    /// Server notifications and responses nobody is waiting for.
    void on_notification(NotificationHandler handler);

    /// The transport ended while Connected (not through disconnect()).
    void on_closed(ClosedHandler handler);

private:
    using ResponseChannel = asio::experimental::channel<
        void(asio::error_code, ClientResult<Json>)
    >;

    struct PendingCall {
        std::shared_ptr<ResponseChannel> channel;
        std::unique_ptr<asio::steady_timer> timer;
        std::string method;
    };

    ServerConnection(std::string id, std::unique_ptr<ITransport> transport, ConnectionOptions options);

    // Strand-only
    asio::awaitable<ClientResult<InitializeResult>> do_connect();
    asio::awaitable<void> do_disconnect();
    asio::awaitable<ClientResult<Json>> do_request(std::string method, Json params);
    asio::awaitable<ClientResult<void>> do_notify(std::string method, Json params);
    asio::awaitable<ClientResult<std::vector<Json>>> list_all(std::string method, std::string items_key);
    asio::awaitable<ClientResult<Json>> checked_request(std::string method, Json params);

    asio::awaitable<void> message_dispatcher(std::shared_ptr<ServerConnection> self);
    asio::awaitable<void> handle_message(const Json& message);
    asio::awaitable<void> answer_server_request(const JsonRpcServerRequest& request);
    void handle_response(const JsonRpcResponse& response);
    void dispatch_notification(const std::string& method, const Json& params);
    void handle_transport_closed(const std::string& reason);

    void resolve(std::uint64_t id, ClientResult<Json> result);
    void expire(std::uint64_t id);
    void fail_all_pending(const ClientError& error);
    asio::awaitable<void> stop_transport();
    void set_last_error(std::string message);

    std::string id_;
    std::unique_ptr<ITransport> transport_;
    ConnectionOptions options_;
    asio::strand<asio::any_io_executor> strand_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<std::size_t> pending_size_{0};

    // Strand-only state
    bool connect_attempted_{false};
    bool transport_started_{false};
    bool transport_open_{false};
    bool closing_{false};
    std::uint64_t next_id_{0};
    std::unordered_map<std::uint64_t, PendingCall> pending_;

    mutable std::mutex info_mutex_;
    std::optional<Implementation> server_info_;
    std::optional<ServerCapabilities> server_capabilities_;
    std::optional<std::string> last_error_;

    mutable std::mutex handler_mutex_;
    NotificationHandler notification_handler_;
    ClosedHandler closed_handler_;
};

}  // namespace mcphub
