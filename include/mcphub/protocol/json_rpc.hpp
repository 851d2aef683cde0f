#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <tl/expected.hpp>

namespace mcphub {

using Json = nlohmann::json;

struct JsonError {
    enum class Code {
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams,
        Internal
    };

    Code code{Code::Internal};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

struct JsonRpcId {
    std::variant<std::int64_t, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] Json to_json() const;
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const JsonRpcId&, const JsonRpcId&) = default;
};

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, std::int64_t id, std::optional<Json> params = std::nullopt);
    JsonRpcRequest(std::string method, JsonRpcId id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const JsonRpcId& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcRequest> from_json(const Json& payload);

private:
    std::string method_;
    JsonRpcId id_;
    std::optional<Json> params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    std::optional<Json> params_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Errors and Responses
// ─────────────────────────────────────────────────────────────────────────────

namespace ErrorCode {
    constexpr std::int64_t ParseError     = -32700;
    constexpr std::int64_t InvalidRequest = -32600;
    constexpr std::int64_t MethodNotFound = -32601;
    constexpr std::int64_t InvalidParams  = -32602;
    constexpr std::int64_t InternalError  = -32603;
}

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcError> from_json(const Json& payload);
};

/// Reply to one of our requests. Exactly one of result / error is set.
/// `id` is empty when the server could not read the request id.
struct JsonRpcResponse {
    std::optional<JsonRpcId> id;
    std::optional<Json> result;
    std::optional<JsonRpcError> error;

    [[nodiscard]] bool is_error() const noexcept { return error.has_value(); }
};

/// A request initiated by the server (e.g. ping).
struct JsonRpcServerRequest {
    JsonRpcId id;
    std::string method;
    Json params;
};

struct JsonRpcServerNotification {
    std::string method;
    Json params;
};

using IncomingMessage = std::variant<
    JsonRpcResponse,
    JsonRpcServerRequest,
    JsonRpcServerNotification
>;

/// Classify one inbound envelope (object, not batch).
[[nodiscard]] JsonResult<IncomingMessage> parse_incoming(const Json& payload);

[[nodiscard]] Json make_response(const JsonRpcId& id, Json result);
[[nodiscard]] Json make_error_response(const JsonRpcId& id, const JsonRpcError& error);

}  // namespace mcphub
