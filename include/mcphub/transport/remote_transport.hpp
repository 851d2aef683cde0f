#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Remote Transport
// ═══════════════════════════════════════════════════════════════════════════
// Request/response JSON-RPC over HTTP: every outgoing envelope is one POST
// whose body is the envelope. The response body (if any) carries the reply.
//
// The HTTP client blocks, so posts run on a small owned thread pool and the
// replies are handed back through a channel. Failures that belong to one
// request (transport error, non-2xx status, unparsable body) are delivered
// as a TransportError tagged with that request's id; the transport itself
// stays usable.

#include "mcphub/transport/http_client.hpp"
#include "mcphub/transport/http_types.hpp"
#include "mcphub/transport/transport.hpp"

#include <asio/experimental/concurrent_channel.hpp>
#include <asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace mcphub {

struct RemoteTransportConfig {
    std::string url;

    /// Sent with every POST (Authorization, API keys, ...).
    HeaderMap headers;

    /// Bounds each HTTP exchange; the HTTP client aborts the request on expiry.
    std::chrono::milliseconds request_timeout{std::chrono::seconds(300)};
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};

    bool verify_ssl{true};

    /// Concurrent POSTs in flight.
    std::size_t worker_threads{2};

    std::size_t channel_capacity{64};

    /// Log prefix; defaults to the URL.
    std::string label;
};

class RemoteTransport : public ITransport {
public:
    RemoteTransport(asio::any_io_executor executor, RemoteTransportConfig config);

    /// Inject a client (tests, alternative HTTP stacks).
    RemoteTransport(
        asio::any_io_executor executor,
        RemoteTransportConfig config,
        std::unique_ptr<IHttpClient> client
    );

    ~RemoteTransport() override;

    RemoteTransport(const RemoteTransport&) = delete;
    RemoteTransport& operator=(const RemoteTransport&) = delete;
    RemoteTransport(RemoteTransport&&) = delete;
    RemoteTransport& operator=(RemoteTransport&&) = delete;

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<Json>> async_receive() override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] const RemoteTransportConfig& config() const { return config_; }

private:
    using InboundChannel = asio::experimental::concurrent_channel<
        void(asio::error_code, TransportResult<Json>)
    >;

    // Runs on a pool thread.
    void post_envelope(const std::string& body, std::optional<std::uint64_t> request_id);
    void deliver(TransportResult<Json> result);
    void fail_request(std::optional<std::uint64_t> request_id, TransportError error);

    RemoteTransportConfig config_;
    asio::any_io_executor executor_;
    std::unique_ptr<IHttpClient> client_;

    std::unique_ptr<asio::thread_pool> pool_;
    std::unique_ptr<InboundChannel> inbound_;

    std::atomic<bool> running_{false};
    std::atomic<bool> closed_seen_{false};
};

}  // namespace mcphub
