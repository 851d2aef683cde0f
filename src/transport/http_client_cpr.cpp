#include "mcphub/transport/http_client.hpp"

#include <cpr/cpr.h>

#include <atomic>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// cpr::Post is blocking; cancellation goes through a progress callback that
// libcurl polls while the transfer runs.

class CprHttpClient : public IHttpClient {
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    void set_default_headers(const HeaderMap& headers) override {
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ = timeout;
    }

    void set_request_timeout(std::chrono::milliseconds timeout) override {
        request_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& url,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers
    ) override {
        if (cancelled_.load()) {
            return tl::unexpected(HttpClientError::cancelled());
        }

        auto request_headers = build_headers(headers);
        request_headers["Content-Type"] = content_type;

        // Returning false from the callback aborts the transfer.
        cpr::ProgressCallback progress(
            [this](auto /*download_total*/, auto /*download_now*/,
                   auto /*upload_total*/, auto /*upload_now*/, intptr_t /*userdata*/) {
                return cancelled_.load() == false;
            });

        auto response = cpr::Post(
            cpr::Url{url},
            request_headers,
            cpr::Body{body},
            cpr::ConnectTimeout{connect_timeout_},
            cpr::Timeout{request_timeout_},
            cpr::VerifySsl{verify_ssl_},
            progress
        );

        if (cancelled_.load()) {
            return tl::unexpected(HttpClientError::cancelled());
        }
        return convert_response(response);
    }

    void cancel() override {
        cancelled_.store(true);
    }

    void reset() override {
        cancelled_.store(false);
    }

private:
    cpr::Header build_headers(const HeaderMap& extra_headers) const {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : default_headers_) {
            cpr_headers[name] = value;
        }
        for (const auto& [name, value] : extra_headers) {
            cpr_headers[name] = value;
        }
        return cpr_headers;
    }

    static HttpClientResult<HttpClientResponse> convert_response(const cpr::Response& response) {
        if (response.error.code != cpr::ErrorCode::OK) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = response.text;
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

    static HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        const bool is_ssl_error =
            (msg.find("SSL") != std::string::npos) ||
            (msg.find("ssl") != std::string::npos) ||
            (msg.find("certificate") != std::string::npos);
        if (is_ssl_error) {
            return HttpClientError::ssl_error(msg);
        }

        switch (error.code) {
            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return HttpClientError::timeout(msg);
            case cpr::ErrorCode::SSL_CONNECT_ERROR:
                return HttpClientError::ssl_error(msg);
            case cpr::ErrorCode::OK:
                return HttpClientError::unknown("No error");
            default:
                return HttpClientError::connection_failed(msg);
        }
    }

    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds request_timeout_{300000};
    bool verify_ssl_{true};

    std::atomic<bool> cancelled_{false};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace mcphub
