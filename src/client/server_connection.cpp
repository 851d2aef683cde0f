#include "mcphub/client/server_connection.hpp"
#include "mcphub/log/logger.hpp"

#include <asio/as_tuple.hpp>
#include <asio/bind_executor.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>

#include <variant>

namespace mcphub {

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

std::shared_ptr<ServerConnection> ServerConnection::create(
    std::string id,
    std::unique_ptr<ITransport> transport,
    ConnectionOptions options
) {
    return std::shared_ptr<ServerConnection>(
        new ServerConnection(std::move(id), std::move(transport), std::move(options)));
}

ServerConnection::ServerConnection(
    std::string id,
    std::unique_ptr<ITransport> transport,
    ConnectionOptions options
)
    : id_(std::move(id))
    , transport_(std::move(transport))
    , options_(std::move(options))
    , strand_(asio::make_strand(transport_->get_executor()))
{}

ServerConnection::~ServerConnection() {
    // The dispatcher holds a reference while it runs, so nothing is left
    // waiting here; timers only hold weak references.
    for (auto& [id, call] : pending_) {
        call.timer->cancel();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Public API (hops onto the strand)
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<InitializeResult>> ServerConnection::connect() {
    auto self = shared_from_this();
    co_return co_await asio::co_spawn(strand_, do_connect(), asio::use_awaitable);
}

asio::awaitable<void> ServerConnection::disconnect() {
    auto self = shared_from_this();
    co_await asio::co_spawn(strand_, do_disconnect(), asio::use_awaitable);
}

asio::awaitable<ClientResult<Json>> ServerConnection::request(std::string method, Json params) {
    auto self = shared_from_this();
    co_return co_await asio::co_spawn(
        strand_, checked_request(std::move(method), std::move(params)), asio::use_awaitable);
}

asio::awaitable<ClientResult<void>> ServerConnection::notify(std::string method, Json params) {
    auto self = shared_from_this();
    co_return co_await asio::co_spawn(
        strand_, do_notify(std::move(method), std::move(params)), asio::use_awaitable);
}

asio::awaitable<ClientResult<std::vector<Tool>>> ServerConnection::list_tools() {
    auto self = shared_from_this();
    auto items = co_await asio::co_spawn(strand_, list_all("tools/list", "tools"), asio::use_awaitable);
    if (!items) {
        co_return tl::unexpected(items.error());
    }

    std::vector<Tool> tools;
    tools.reserve(items->size());
    for (const auto& item : *items) {
        tools.push_back(Tool::from_json(item));
    }
    co_return tools;
}

asio::awaitable<ClientResult<std::vector<Resource>>> ServerConnection::list_resources() {
    auto self = shared_from_this();
    auto items = co_await asio::co_spawn(strand_, list_all("resources/list", "resources"), asio::use_awaitable);
    if (!items) {
        co_return tl::unexpected(items.error());
    }

    std::vector<Resource> resources;
    resources.reserve(items->size());
    for (const auto& item : *items) {
        resources.push_back(Resource::from_json(item));
    }
    co_return resources;
}

asio::awaitable<ClientResult<std::vector<Prompt>>> ServerConnection::list_prompts() {
    auto self = shared_from_this();
    auto items = co_await asio::co_spawn(strand_, list_all("prompts/list", "prompts"), asio::use_awaitable);
    if (!items) {
        co_return tl::unexpected(items.error());
    }

    std::vector<Prompt> prompts;
    prompts.reserve(items->size());
    for (const auto& item : *items) {
        prompts.push_back(Prompt::from_json(item));
    }
    co_return prompts;
}

asio::awaitable<ClientResult<Json>> ServerConnection::call_tool(std::string name, Json arguments) {
    CallToolParams params{std::move(name), arguments.is_null() ? Json::object() : std::move(arguments)};
    co_return co_await request("tools/call", params.to_json());
}

asio::awaitable<ClientResult<Json>> ServerConnection::read_resource(std::string uri) {
    co_return co_await request("resources/read", Json{{"uri", std::move(uri)}});
}

asio::awaitable<ClientResult<Json>> ServerConnection::get_prompt(std::string name, Json arguments) {
    Json params = {{"name", std::move(name)}};
    if (arguments.is_object() && arguments.empty() == false) {
        params["arguments"] = std::move(arguments);
    }
    co_return co_await request("prompts/get", std::move(params));
}

std::optional<Implementation> ServerConnection::server_info() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return server_info_;
}

std::optional<ServerCapabilities> ServerConnection::server_capabilities() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return server_capabilities_;
}

std::optional<std::string> ServerConnection::last_error() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return last_error_;
}

void ServerConnection::on_notification(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    notification_handler_ = std::move(handler);
}

void ServerConnection::on_closed(ClosedHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    closed_handler_ = std::move(handler);
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle (strand)
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<InitializeResult>> ServerConnection::do_connect() {
    if (connect_attempted_) {
        co_return tl::unexpected(
            ClientError::protocol_error("connect() already attempted on this connection").on_server(id_));
    }
    connect_attempted_ = true;
    if (closing_) {
        co_return tl::unexpected(
            ClientError::server_unavailable("Server " + id_ + " was disconnected before connecting").on_server(id_));
    }
    state_ = ConnectionState::Connecting;

    MCPHUB_LOG_DEBUG("[{}] connecting to {}", id_, transport_->describe());

    auto started = co_await transport_->async_start();
    if (!started) {
        set_last_error(started.error().message);
        state_ = ConnectionState::Failed;
        MCPHUB_LOG_ERROR("[{}] transport failed to start: {}", id_, started.error().message);
        co_return tl::unexpected(ClientError::from_transport(started.error()).on_server(id_));
    }
    transport_started_ = true;
    transport_open_ = true;

    asio::co_spawn(strand_, message_dispatcher(shared_from_this()), asio::detached);

    InitializeParams params;
    params.client_info = {options_.client_name, options_.client_version};
    params.capabilities = options_.capabilities;

    auto fail = [this](const ClientError& error) {
        set_last_error(error.message);
        MCPHUB_LOG_ERROR("[{}] initialize failed: {}", id_, error.message);
    };

    auto result = co_await do_request("initialize", params.to_json());
    if (!result) {
        fail(result.error());
        co_await stop_transport();
        state_ = closing_ ? ConnectionState::Disconnected : ConnectionState::Failed;
        co_return tl::unexpected(result.error());
    }

    auto init = InitializeResult::from_json(*result);
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        server_info_ = init.server_info;
        server_capabilities_ = init.capabilities;
    }

    auto notified = co_await do_notify("notifications/initialized", Json::object());
    if (!notified) {
        fail(notified.error());
        co_await stop_transport();
        state_ = closing_ ? ConnectionState::Disconnected : ConnectionState::Failed;
        co_return tl::unexpected(notified.error());
    }

    state_ = ConnectionState::Connected;
    MCPHUB_LOG_INFO("[{}] connected to {} {} (protocol {})",
                    id_, init.server_info.name, init.server_info.version, init.protocol_version);
    co_return init;
}

asio::awaitable<void> ServerConnection::do_disconnect() {
    closing_ = true;
    const auto previous = state_.exchange(ConnectionState::Disconnected);

    fail_all_pending(ClientError::server_unavailable("Server " + id_ + " is shutting down").on_server(id_));
    co_await stop_transport();

    if (previous != ConnectionState::Disconnected) {
        MCPHUB_LOG_INFO("[{}] disconnected", id_);
    }
}

asio::awaitable<void> ServerConnection::stop_transport() {
    transport_open_ = false;
    if (transport_started_) {
        co_await transport_->async_stop();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Requests (strand)
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<ClientResult<Json>> ServerConnection::checked_request(std::string method, Json params) {
    if (state_ != ConnectionState::Connected) {
        co_return tl::unexpected(ClientError::server_unavailable(
            "Server " + id_ + " is " + std::string(to_string(state_.load()))).on_server(id_));
    }
    co_return co_await do_request(std::move(method), std::move(params));
}

asio::awaitable<ClientResult<Json>> ServerConnection::do_request(std::string method, Json params) {
    if (!transport_open_ || closing_) {
        co_return tl::unexpected(
            ClientError::server_unavailable("Server " + id_ + " is not connected").on_server(id_));
    }

    const std::uint64_t id = ++next_id_;
    JsonRpcRequest request(method, static_cast<std::int64_t>(id), std::move(params));

    PendingCall call{
        std::make_shared<ResponseChannel>(strand_, 1),
        std::make_unique<asio::steady_timer>(strand_),
        method
    };
    auto channel = call.channel;

    if (options_.request_timeout.count() > 0) {
        call.timer->expires_after(options_.request_timeout);
        call.timer->async_wait(asio::bind_executor(strand_,
            [weak = weak_from_this(), id](asio::error_code ec) {
                if (ec) {
                    return;  // Cancelled: resolved some other way
                }
                if (auto self = weak.lock()) {
                    self->expire(id);
                }
            }));
    }

    pending_.emplace(id, std::move(call));
    pending_size_ = pending_.size();

    MCPHUB_LOG_TRACE("[{}] -> {} (id {})", id_, method, id);

    auto sent = co_await transport_->async_send(request.to_json());
    if (!sent) {
        if (auto it = pending_.find(id); it != pending_.end()) {
            it->second.timer->cancel();
            pending_.erase(it);
            pending_size_ = pending_.size();
        }
        co_return tl::unexpected(ClientError::from_transport(sent.error()).on_server(id_));
    }

    auto [ec, result] = co_await channel->async_receive(asio::as_tuple(asio::use_awaitable));
    if (ec) {
        co_return tl::unexpected(
            ClientError::server_unavailable("Server " + id_ + " closed the request").on_server(id_));
    }
    co_return std::move(result);
}

asio::awaitable<ClientResult<void>> ServerConnection::do_notify(std::string method, Json params) {
    if (!transport_open_ || closing_) {
        co_return tl::unexpected(
            ClientError::server_unavailable("Server " + id_ + " is not connected").on_server(id_));
    }

    JsonRpcNotification notification(std::move(method), std::move(params));
    auto sent = co_await transport_->async_send(notification.to_json());
    if (!sent) {
        co_return tl::unexpected(ClientError::from_transport(sent.error()).on_server(id_));
    }
    co_return ClientResult<void>{};
}

asio::awaitable<ClientResult<std::vector<Json>>> ServerConnection::list_all(
    std::string method,
    std::string items_key
) {
    if (state_ != ConnectionState::Connected) {
        co_return tl::unexpected(ClientError::server_unavailable(
            "Server " + id_ + " is " + std::string(to_string(state_.load()))).on_server(id_));
    }

    std::vector<Json> items;
    std::optional<std::string> cursor;

    for (std::size_t page = 0; page < options_.max_list_pages; ++page) {
        Json params = Json::object();
        if (cursor) {
            params["cursor"] = *cursor;
        }

        auto result = co_await do_request(method, std::move(params));
        if (!result) {
            co_return tl::unexpected(result.error());
        }
        if (result->is_object() == false) {
            co_return tl::unexpected(
                ClientError::protocol_error(method + " result is not an object").on_server(id_));
        }

        if (const auto it = result->find(items_key); it != result->end() && it->is_array()) {
            for (const auto& item : *it) {
                if (item.is_object()) {
                    items.push_back(item);
                }
            }
        }

        auto next = detail::next_cursor(*result);
        if (next.has_value() == false) {
            co_return items;
        }
        if (next == cursor) {
            MCPHUB_LOG_WARN("[{}] {} repeated cursor '{}', stopping", id_, method, *next);
            co_return items;
        }
        cursor = std::move(next);
    }

    MCPHUB_LOG_WARN("[{}] {} stopped after {} pages", id_, method, options_.max_list_pages);
    co_return items;
}

void ServerConnection::resolve(std::uint64_t id, ClientResult<Json> result) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        MCPHUB_LOG_DEBUG("[{}] discarding response for unknown request id {}", id_, id);
        return;
    }

    it->second.timer->cancel();
    it->second.channel->try_send(asio::error_code{}, std::move(result));
    pending_.erase(it);
    pending_size_ = pending_.size();
}

void ServerConnection::expire(std::uint64_t id) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return;
    }

    MCPHUB_LOG_WARN("[{}] {} (id {}) timed out after {}ms",
                    id_, it->second.method, id, options_.request_timeout.count());
    it->second.channel->try_send(
        asio::error_code{},
        tl::unexpected(ClientError::timeout(
            "Request " + it->second.method + " timed out after " +
            std::to_string(options_.request_timeout.count()) + "ms").on_server(id_)));
    pending_.erase(it);
    pending_size_ = pending_.size();
}

void ServerConnection::fail_all_pending(const ClientError& error) {
    for (auto& [id, call] : pending_) {
        call.timer->cancel();
        call.channel->try_send(asio::error_code{}, tl::unexpected(error));
    }
    pending_.clear();
    pending_size_ = 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Inbound (strand)
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> ServerConnection::message_dispatcher(
    [[maybe_unused]] std::shared_ptr<ServerConnection> self
) {
    // `self` keeps the connection alive until the stream ends.
    while (true) {
        auto received = co_await transport_->async_receive();

        if (!received) {
            const auto& error = received.error();
            if (error.request_id) {
                // Failure of one request (HTTP status, bad body); the stream lives on.
                resolve(*error.request_id,
                        tl::unexpected(ClientError::from_transport(error).on_server(id_)));
                continue;
            }
            if (error.category == TransportError::Category::Closed) {
                handle_transport_closed(error.message);
                break;
            }
            MCPHUB_LOG_WARN("[{}] transport error: {}", id_, error.message);
            continue;
        }

        if (received->is_array()) {
            for (const auto& message : *received) {
                co_await handle_message(message);
            }
        } else {
            co_await handle_message(*received);
        }
    }
}

asio::awaitable<void> ServerConnection::handle_message(const Json& message) {
    auto parsed = parse_incoming(message);
    if (!parsed) {
        // A reply we can still correlate fails its call instead of leaving it to time out.
        const auto id = message.is_object() && message.contains("method") == false
            ? message.find("id") : message.end();
        if (id != message.end() && id->is_number_integer() && id->get<std::int64_t>() >= 0
            && pending_.contains(id->get<std::uint64_t>())) {
            MCPHUB_LOG_WARN("[{}] malformed reply to request {}: {}", id_, id->dump(), parsed.error().message);
            resolve(id->get<std::uint64_t>(), tl::unexpected(ClientError::malformed_message(
                "Malformed reply: " + parsed.error().message).on_server(id_)));
            co_return;
        }
        MCPHUB_LOG_WARN("[{}] ignoring malformed message: {}", id_, parsed.error().message);
        co_return;
    }

    if (const auto* response = std::get_if<JsonRpcResponse>(&*parsed)) {
        handle_response(*response);
    } else if (const auto* request = std::get_if<JsonRpcServerRequest>(&*parsed)) {
        co_await answer_server_request(*request);
    } else {
        const auto& notification = std::get<JsonRpcServerNotification>(*parsed);
        dispatch_notification(notification.method, notification.params);
    }
}

void ServerConnection::handle_response(const JsonRpcResponse& response) {
    const auto* number = response.id ? std::get_if<std::int64_t>(&response.id->value) : nullptr;
    if (number == nullptr || *number < 0) {
        if (response.error) {
            MCPHUB_LOG_WARN("[{}] server error without usable id: {} ({})",
                            id_, response.error->message, response.error->code);
        } else {
            MCPHUB_LOG_DEBUG("[{}] discarding response with unusable id", id_);
        }
        return;
    }

    const auto id = static_cast<std::uint64_t>(*number);
    if (response.error) {
        resolve(id, tl::unexpected(ClientError::from_rpc_error(*response.error).on_server(id_)));
    } else {
        resolve(id, response.result.value_or(Json::object()));
    }
}

asio::awaitable<void> ServerConnection::answer_server_request(const JsonRpcServerRequest& request) {
    MCPHUB_LOG_DEBUG("[{}] server request: {}", id_, request.method);

    Json reply;
    if (request.method == "ping") {
        reply = make_response(request.id, Json::object());
    } else {
        reply = make_error_response(request.id, JsonRpcError{
            ErrorCode::MethodNotFound,
            "Method not found: " + request.method
        });
    }

    auto sent = co_await transport_->async_send(std::move(reply));
    if (!sent) {
        MCPHUB_LOG_WARN("[{}] failed to answer {}: {}", id_, request.method, sent.error().message);
    }
}

void ServerConnection::dispatch_notification(const std::string& method, const Json& params) {
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = notification_handler_;
    }
    if (!handler) {
        return;
    }

    try {
        handler(method, params);
    } catch (const std::exception& e) {
        MCPHUB_LOG_ERROR("[{}] notification handler threw: {}", id_, e.what());
    }
}

void ServerConnection::handle_transport_closed(const std::string& reason) {
    transport_open_ = false;
    fail_all_pending(ClientError::transport_error("Server connection closed: " + reason).on_server(id_));

    if (closing_) {
        return;
    }

    // While Connecting, the failed initialize records the error and marks
    // the attempt Failed.
    auto expected = ConnectionState::Connected;
    if (state_.compare_exchange_strong(expected, ConnectionState::Disconnected) == false) {
        return;
    }
    set_last_error(reason);

    MCPHUB_LOG_WARN("[{}] connection lost: {}", id_, reason);

    ClosedHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = closed_handler_;
    }
    if (!handler) {
        return;
    }
    try {
        handler(reason);
    } catch (const std::exception& e) {
        MCPHUB_LOG_ERROR("[{}] close handler threw: {}", id_, e.what());
    }
}

void ServerConnection::set_last_error(std::string message) {
    std::lock_guard<std::mutex> lock(info_mutex_);
    last_error_ = std::move(message);
}

}  // namespace mcphub
