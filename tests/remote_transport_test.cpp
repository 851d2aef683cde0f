// ─────────────────────────────────────────────────────────────────────────────
// Remote Transport Tests
// ─────────────────────────────────────────────────────────────────────────────
// POST-per-envelope over an injected MockHttpClient.

#include <catch2/catch_test_macros.hpp>

#include "mcphub/transport/remote_transport.hpp"
#include "mocks/mock_http_client.hpp"
#include "test_support.hpp"

#include <memory>
#include <string>

using namespace mcphub;
using namespace mcphub::testing;
using namespace std::chrono_literals;

namespace {

struct RemoteFixture {
    TestLoop loop;
    MockHttpClient* http = nullptr;
    std::unique_ptr<RemoteTransport> transport;

    explicit RemoteFixture(RemoteTransportConfig config = default_config()) {
        auto client = std::make_unique<MockHttpClient>();
        http = client.get();
        transport = std::make_unique<RemoteTransport>(loop.executor(), std::move(config), std::move(client));
    }

    ~RemoteFixture() {
        loop.run(transport->async_stop());
        transport.reset();
    }

    static RemoteTransportConfig default_config() {
        RemoteTransportConfig config;
        config.url = "https://search.example.com/mcp";
        config.worker_threads = 1;
        return config;
    }

    void start() {
        REQUIRE(loop.run(transport->async_start()).has_value());
    }
};

Json request(std::int64_t id, const std::string& method) {
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", Json::object()}};
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Start configures the HTTP client", "[remote]") {
    auto config = RemoteFixture::default_config();
    set_header(config.headers, "Authorization", "Bearer token-123");
    config.request_timeout = 45s;
    config.verify_ssl = false;
    RemoteFixture fixture(config);

    fixture.start();

    REQUIRE(fixture.transport->is_running());
    REQUIRE(get_header(fixture.http->default_headers(), "authorization") == "Bearer token-123");
    REQUIRE(fixture.http->request_timeout() == 45s);
    REQUIRE(fixture.http->verify_ssl() == false);
    REQUIRE(fixture.transport->describe() == "https://search.example.com/mcp");
}

TEST_CASE("An invalid URL fails start", "[remote]") {
    auto config = RemoteFixture::default_config();
    config.url = "ftp://files.example.com";
    RemoteFixture fixture(config);

    auto started = fixture.loop.run(fixture.transport->async_start());

    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().category == TransportError::Category::Protocol);
}

TEST_CASE("Sending before start fails", "[remote]") {
    RemoteFixture fixture;

    auto sent = fixture.loop.run(fixture.transport->async_send(request(1, "initialize")));

    REQUIRE_FALSE(sent.has_value());
    REQUIRE(fixture.http->request_count() == 0);
}

TEST_CASE("Stop ends the stream and cancels the client", "[remote]") {
    RemoteFixture fixture;
    fixture.start();

    auto pending = fixture.loop.start(fixture.transport->async_receive());
    fixture.loop.run(fixture.transport->async_stop());

    auto received = pending.get();
    REQUIRE_FALSE(received.has_value());
    REQUIRE(received.error().category == TransportError::Category::Closed);
    REQUIRE(fixture.http->was_cancelled());
    REQUIRE(fixture.transport->is_running() == false);
}

// ═══════════════════════════════════════════════════════════════════════════
// Exchanges
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Each envelope is one POST and the body is the reply", "[remote]") {
    RemoteFixture fixture;
    fixture.http->set_response_handler([](const std::string& body) -> HttpClientResult<HttpClientResponse> {
        const auto sent = Json::parse(body);
        return HttpClientResponse{200, {{"Content-Type", "application/json"}},
                                  reply_to(sent, {{"tools", Json::array()}}).dump()};
    });
    fixture.start();

    REQUIRE(fixture.loop.run(fixture.transport->async_send(request(4, "tools/list"))).has_value());
    auto reply = fixture.loop.run(fixture.transport->async_receive());

    REQUIRE(reply.has_value());
    REQUIRE((*reply)["id"] == 4);
    REQUIRE((*reply)["result"]["tools"].is_array());

    auto posted = fixture.http->last_request().value();
    REQUIRE(posted.url == "https://search.example.com/mcp");
    REQUIRE(posted.content_type == "application/json");
    REQUIRE(Json::parse(posted.body)["method"] == "tools/list");
    REQUIRE(get_header(posted.headers, "Accept") == "application/json");
}

TEST_CASE("A non-2xx status fails only that request", "[remote]") {
    RemoteFixture fixture;
    fixture.http->queue_response(503, "Service Unavailable");
    fixture.start();

    REQUIRE(fixture.loop.run(fixture.transport->async_send(request(9, "tools/call"))).has_value());
    auto received = fixture.loop.run(fixture.transport->async_receive());

    REQUIRE_FALSE(received.has_value());
    REQUIRE(received.error().category == TransportError::Category::Network);
    REQUIRE(received.error().status_code == 503);
    REQUIRE(received.error().request_id == std::uint64_t{9});
    REQUIRE(fixture.transport->is_running());
}

TEST_CASE("An HTTP timeout is reported as a Timeout for that request", "[remote]") {
    RemoteFixture fixture;
    fixture.http->queue_timeout();
    fixture.start();

    REQUIRE(fixture.loop.run(fixture.transport->async_send(request(2, "tools/call"))).has_value());
    auto received = fixture.loop.run(fixture.transport->async_receive());

    REQUIRE_FALSE(received.has_value());
    REQUIRE(received.error().category == TransportError::Category::Timeout);
    REQUIRE(received.error().request_id == std::uint64_t{2});
}

TEST_CASE("An unparsable body fails the request", "[remote]") {
    RemoteFixture fixture;
    fixture.http->queue_json_response(200, "<html>gateway</html>");
    fixture.start();

    REQUIRE(fixture.loop.run(fixture.transport->async_send(request(3, "tools/list"))).has_value());
    auto received = fixture.loop.run(fixture.transport->async_receive());

    REQUIRE_FALSE(received.has_value());
    REQUIRE(received.error().category == TransportError::Category::Protocol);
    REQUIRE(received.error().request_id == std::uint64_t{3});
}

TEST_CASE("A body that does not answer the request fails it", "[remote]") {
    RemoteFixture fixture;
    fixture.http->queue_json_response(200,
        R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})");
    fixture.start();

    REQUIRE(fixture.loop.run(fixture.transport->async_send(request(4, "tools/call"))).has_value());

    // The body itself still reaches the connection, followed by the failure.
    auto delivered = fixture.loop.run(fixture.transport->async_receive());
    REQUIRE(delivered.has_value());
    REQUIRE((*delivered)["id"].is_null());

    auto failed = fixture.loop.run(fixture.transport->async_receive());
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().category == TransportError::Category::Protocol);
    REQUIRE(failed.error().request_id == std::uint64_t{4});
    REQUIRE(fixture.transport->is_running());
}

TEST_CASE("A notification accepted with an empty body delivers nothing", "[remote]") {
    RemoteFixture fixture;
    fixture.http->queue_response(202, "");
    fixture.http->queue_json_response(200, R"({"jsonrpc":"2.0","id":5,"result":{}})");
    fixture.start();

    Json notification = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    REQUIRE(fixture.loop.run(fixture.transport->async_send(notification)).has_value());
    REQUIRE(fixture.loop.run(fixture.transport->async_send(request(5, "ping"))).has_value());

    auto received = fixture.loop.run(fixture.transport->async_receive());
    REQUIRE(received.has_value());
    REQUIRE((*received)["id"] == 5);
    REQUIRE(fixture.http->request_count() == 2);
}

TEST_CASE("A batch body delivers each element", "[remote]") {
    RemoteFixture fixture;
    fixture.http->queue_json_response(200, R"([
        {"jsonrpc":"2.0","method":"notifications/tools/list_changed"},
        {"jsonrpc":"2.0","id":6,"result":{"ok":true}}
    ])");
    fixture.start();

    REQUIRE(fixture.loop.run(fixture.transport->async_send(request(6, "tools/call"))).has_value());

    auto first = fixture.loop.run(fixture.transport->async_receive());
    auto second = fixture.loop.run(fixture.transport->async_receive());
    REQUIRE(first.has_value());
    REQUIRE((*first)["method"] == "notifications/tools/list_changed");
    REQUIRE(second.has_value());
    REQUIRE((*second)["result"]["ok"] == true);
}
