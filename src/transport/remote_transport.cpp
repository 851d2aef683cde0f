#include "mcphub/transport/remote_transport.hpp"
#include "mcphub/log/logger.hpp"
#include "mcphub/transport/line_framer.hpp"

#include <asio/as_tuple.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <cctype>

namespace mcphub {

namespace {

constexpr const char* kJsonContentType = "application/json";

TransportError make_error(TransportError::Category cat, std::string msg) {
    return TransportError{cat, std::move(msg)};
}

bool is_blank(const std::string& body) {
    return std::all_of(body.begin(), body.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

/// Requests carry both "method" and a numeric "id"; their reply is expected
/// in the POST response.
std::optional<std::uint64_t> outgoing_request_id(const Json& message) {
    if (message.is_object() == false || message.contains("method") == false) {
        return std::nullopt;
    }
    const auto it = message.find("id");
    if (it == message.end() || it->is_number_integer() == false || it->get<std::int64_t>() < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(it->get<std::int64_t>());
}

bool answers(const Json& message, std::uint64_t request_id) {
    if (message.is_object() == false || message.contains("method")) {
        return false;
    }
    const auto it = message.find("id");
    return it != message.end() && it->is_number_integer() && it->get<std::int64_t>() >= 0
        && static_cast<std::uint64_t>(it->get<std::int64_t>()) == request_id;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

RemoteTransport::RemoteTransport(asio::any_io_executor executor, RemoteTransportConfig config)
    : RemoteTransport(std::move(executor), std::move(config), make_http_client())
{}

RemoteTransport::RemoteTransport(
    asio::any_io_executor executor,
    RemoteTransportConfig config,
    std::unique_ptr<IHttpClient> client
)
    : config_(std::move(config))
    , executor_(std::move(executor))
    , client_(std::move(client))
{
    if (config_.label.empty()) {
        config_.label = config_.url;
    }
}

RemoteTransport::~RemoteTransport() {
    running_ = false;
    if (client_) {
        client_->cancel();
    }
    if (inbound_) {
        inbound_->close();
    }
    // Workers reference this object.
    if (pool_) {
        pool_->join();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// ITransport
// ═══════════════════════════════════════════════════════════════════════════

asio::any_io_executor RemoteTransport::get_executor() {
    return executor_;
}

asio::awaitable<TransportResult<void>> RemoteTransport::async_start() {
    if (running_ || inbound_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "Transport already started"
        ));
    }

    const auto url = parse_url(config_.url);
    if (url.has_value() == false) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "Invalid server URL: " + config_.url
        ));
    }

    client_->reset();
    client_->set_default_headers(config_.headers);
    client_->set_connect_timeout(config_.connect_timeout);
    client_->set_request_timeout(config_.request_timeout);
    client_->set_verify_ssl(config_.verify_ssl);

    pool_ = std::make_unique<asio::thread_pool>(std::max<std::size_t>(config_.worker_threads, 1));
    inbound_ = std::make_unique<InboundChannel>(executor_, config_.channel_capacity);
    running_ = true;

    MCPHUB_LOG_INFO("[{}] remote transport ready ({}:{})",
                    config_.label, url->host, url->port);
    co_return TransportResult<void>{};
}

asio::awaitable<void> RemoteTransport::async_stop() {
    if (running_.exchange(false) == false) {
        co_return;
    }

    client_->cancel();
    if (inbound_) {
        inbound_->close();
    }
    MCPHUB_LOG_INFO("[{}] remote transport stopped", config_.label);
    co_return;
}

asio::awaitable<TransportResult<void>> RemoteTransport::async_send(Json message) {
    if (!running_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Transport not running"
        ));
    }

    std::string body;
    try {
        body = message.dump();
    } catch (const Json::type_error& e) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "Failed to serialize message: " + std::string(e.what())
        ));
    }

    asio::post(*pool_, [this, body = std::move(body), request_id = outgoing_request_id(message)] {
        post_envelope(body, request_id);
    });
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<Json>> RemoteTransport::async_receive() {
    if (!inbound_ || closed_seen_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Closed,
            "Transport closed"
        ));
    }

    auto [ec, result] = co_await inbound_->async_receive(asio::as_tuple(asio::use_awaitable));
    if (ec) {
        closed_seen_ = true;
        co_return tl::unexpected(make_error(
            TransportError::Category::Closed,
            "Transport stopped"
        ));
    }
    co_return std::move(result);
}

bool RemoteTransport::is_running() const {
    return running_;
}

std::string RemoteTransport::describe() const {
    return config_.url;
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal
// ═══════════════════════════════════════════════════════════════════════════

void RemoteTransport::post_envelope(const std::string& body, std::optional<std::uint64_t> request_id) {
    if (!running_) {
        return;
    }

    HeaderMap headers{{"Accept", kJsonContentType}};
    auto response = client_->post(config_.url, body, kJsonContentType, headers);

    if (!response) {
        const auto& error = response.error();
        if (error.code == HttpClientError::Code::Cancelled) {
            return;
        }
        const auto category = (error.code == HttpClientError::Code::Timeout)
            ? TransportError::Category::Timeout
            : TransportError::Category::Network;
        fail_request(request_id, make_error(category, "HTTP request failed: " + error.message));
        return;
    }

    if (response->is_success() == false) {
        auto error = make_error(
            TransportError::Category::Network,
            "HTTP " + std::to_string(response->status_code)
        );
        error.status_code = response->status_code;
        fail_request(request_id, std::move(error));
        return;
    }

    // 202 Accepted / empty body: nothing to deliver for notifications.
    if (is_blank(response->body)) {
        if (request_id.has_value()) {
            fail_request(request_id, make_error(
                TransportError::Category::Protocol,
                "Empty response body"
            ));
        }
        return;
    }

    auto decoded = decode_line(response->body);
    if (!decoded) {
        fail_request(request_id, decoded.error());
        return;
    }

    bool answered = false;
    if (decoded->is_array()) {
        for (auto& element : *decoded) {
            answered = answered || (request_id && answers(element, *request_id));
            deliver(std::move(element));
        }
    } else {
        answered = request_id && answers(*decoded, *request_id);
        deliver(std::move(*decoded));
    }

    if (request_id.has_value() && answered == false) {
        fail_request(request_id, make_error(
            TransportError::Category::Protocol,
            "Response does not answer request " + std::to_string(*request_id)
        ));
    }
}

void RemoteTransport::fail_request(std::optional<std::uint64_t> request_id, TransportError error) {
    if (request_id.has_value() == false) {
        MCPHUB_LOG_WARN("[{}] notification delivery failed: {}", config_.label, error.message);
        return;
    }
    MCPHUB_LOG_DEBUG("[{}] request {} failed: {}", config_.label, *request_id, error.message);
    error.request_id = request_id;
    deliver(tl::unexpected(std::move(error)));
}

void RemoteTransport::deliver(TransportResult<Json> result) {
    if (!running_ || !inbound_) {
        return;
    }
    inbound_->async_send(asio::error_code{}, std::move(result), asio::detached);
}

}  // namespace mcphub
