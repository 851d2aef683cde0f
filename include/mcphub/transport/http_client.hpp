#pragma once

#include "mcphub/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        Cancelled,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError cancelled() {
        return {Code::Cancelled, "Request cancelled"};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Response
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient Interface
// ─────────────────────────────────────────────────────────────────────────────
// Blocking request/response. RemoteTransport calls post() from worker
// threads, so implementations must allow concurrent post() calls once
// configured. Configuration setters are called before the first request.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Headers sent with every request; per-request headers override them.
    virtual void set_default_headers(const HeaderMap& headers) = 0;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    // Whole-request deadline including the response body.
    virtual void set_request_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> post(
        const std::string& url,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers = {}
    ) = 0;

    // Aborts in-flight requests and rejects new ones until reset().
    virtual void cancel() = 0;

    virtual void reset() = 0;
};

/// cpr-backed client.
std::unique_ptr<IHttpClient> make_http_client();

}  // namespace mcphub
