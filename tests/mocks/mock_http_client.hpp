#ifndef MCPHUB_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
#define MCPHUB_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP

#include "mcphub/transport/http_client.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphub::testing {

// ─────────────────────────────────────────────────────────────────────────────
// MockHttpClient - Test double for IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// Allows tests to:
// - Queue canned responses or answer dynamically from the request body
// - Simulate transport errors and timeouts
// - Inspect request history and configuration

struct RecordedRequest {
    std::string url;
    std::string body;
    std::string content_type;
    HeaderMap headers;  // defaults merged in
};

class MockHttpClient final : public IHttpClient {
public:
    using ResponseHandler = std::function<HttpClientResult<HttpClientResponse>(const std::string& body)>;

    // ─────────────────────────────────────────────────────────────────────────
    // Test Setup
    // ─────────────────────────────────────────────────────────────────────────

    void queue_response(int status_code, const std::string& body, const HeaderMap& headers = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        QueuedResponse resp;
        resp.result = HttpClientResponse{status_code, headers, body};
        response_queue_.push_back(std::move(resp));
    }

    void queue_json_response(int status_code, const std::string& body) {
        HeaderMap headers;
        headers["Content-Type"] = "application/json";
        queue_response(status_code, body, headers);
    }

    void queue_error(HttpClientError::Code code, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        QueuedResponse resp;
        resp.error = HttpClientError{code, message};
        response_queue_.push_back(std::move(resp));
    }

    void queue_timeout(const std::string& message = "Request timed out") {
        queue_error(HttpClientError::Code::Timeout, message);
    }

    /// Takes precedence over the queue.
    void set_response_handler(ResponseHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        response_handler_ = std::move(handler);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Test Verification
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<RecordedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    [[nodiscard]] std::optional<RecordedRequest> last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requests_.empty()) {
            return std::nullopt;
        }
        return requests_.back();
    }

    [[nodiscard]] HeaderMap default_headers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return default_headers_;
    }

    [[nodiscard]] std::chrono::milliseconds request_timeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return request_timeout_;
    }

    [[nodiscard]] bool verify_ssl() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return verify_ssl_;
    }

    [[nodiscard]] bool was_cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // IHttpClient Implementation
    // ─────────────────────────────────────────────────────────────────────────

    void set_default_headers(const HeaderMap& headers) override {
        std::lock_guard<std::mutex> lock(mutex_);
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        connect_timeout_ = timeout;
    }

    void set_request_timeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        request_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        std::lock_guard<std::mutex> lock(mutex_);
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& url,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers = {}
    ) override {
        ResponseHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            RecordedRequest req;
            req.url = url;
            req.body = body;
            req.content_type = content_type;
            req.headers = headers;
            for (const auto& [k, v] : default_headers_) {
                if (req.headers.find(k) == req.headers.end()) {
                    req.headers[k] = v;
                }
            }
            requests_.push_back(std::move(req));

            if (cancelled_) {
                return tl::unexpected(HttpClientError::cancelled());
            }
            handler = response_handler_;

            if (!handler) {
                if (response_queue_.empty()) {
                    return tl::unexpected(HttpClientError::connection_failed("No response queued"));
                }
                auto queued = std::move(response_queue_.front());
                response_queue_.pop_front();
                if (queued.error) {
                    return tl::unexpected(*queued.error);
                }
                return *queued.result;
            }
        }

        // Outside the lock: handlers may block to simulate slow servers.
        return handler(body);
    }

    void cancel() override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }

    void reset() override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = false;
    }

private:
    struct QueuedResponse {
        std::optional<HttpClientResponse> result;
        std::optional<HttpClientError> error;
    };

    mutable std::mutex mutex_;
    std::vector<RecordedRequest> requests_;
    std::deque<QueuedResponse> response_queue_;
    ResponseHandler response_handler_;

    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{0};
    std::chrono::milliseconds request_timeout_{0};
    bool verify_ssl_{true};
    bool cancelled_{false};
};

}  // namespace mcphub::testing

#endif  // MCPHUB_TESTS_MOCKS_MOCK_HTTP_CLIENT_HPP
