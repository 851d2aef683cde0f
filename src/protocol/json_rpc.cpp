#include "mcphub/protocol/json_rpc.hpp"

namespace mcphub {
namespace {
constexpr std::string_view kJsonRpcVersion{"2.0"};

bool is_valid_params_type(const Json& node) {
    const bool is_object = node.is_object();
    const bool is_array = node.is_array();
    return (is_object == true) || (is_array == true);
}

JsonResult<JsonRpcId> parse_id_field(const Json& id_node) {
    if (id_node.is_number_integer() == true) {
        return JsonRpcId::integer(id_node.get<std::int64_t>());
    }
    if (id_node.is_string() == true) {
        return JsonRpcId::string(id_node.get<std::string>());
    }

    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be an integer or string"});
}

JsonResult<void> check_version(const Json& payload) {
    const bool has_version_field = payload.contains("jsonrpc");
    if (has_version_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing jsonrpc version field"});
    }

    const Json& version_node = payload.at("jsonrpc");
    const bool version_is_string = version_node.is_string();
    if ((version_is_string == false) || (version_node != kJsonRpcVersion)) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""});
    }
    return {};
}

Json params_or_empty(const Json& payload) {
    const auto it = payload.find("params");
    if (it == payload.end() || it->is_null()) {
        return Json::object();
    }
    return *it;
}
}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

Json JsonRpcId::to_json() const {
    return std::visit([](const auto& id_value) { return Json(id_value); }, value);
}

std::string JsonRpcId::to_string() const {
    if (const auto* number = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*number);
    }
    return std::get<std::string>(value);
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::int64_t id,
                               std::optional<Json> params)
    : JsonRpcRequest(std::move(method), JsonRpcId::integer(id), std::move(params)) {}

JsonRpcRequest::JsonRpcRequest(std::string method,
                               JsonRpcId id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const JsonRpcId& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_json();
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "payload must be a JSON object"});
    }

    auto version = check_version(payload);
    if (version.has_value() == false) {
        return tl::unexpected(version.error());
    }

    const bool has_method_field = payload.contains("method");
    if (has_method_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing method field"});
    }

    const Json& method_node = payload.at("method");
    if (method_node.is_string() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "method must be a string"});
    }

    const bool has_id_field = payload.contains("id");
    if (has_id_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }
    auto parsed_id = parse_id_field(payload.at("id"));
    if (parsed_id.has_value() == false) {
        return tl::unexpected(parsed_id.error());
    }

    std::optional<Json> parsed_params;
    if (payload.contains("params") == true) {
        const Json& params_node = payload.at("params");
        if (is_valid_params_type(params_node) == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidParams,
                "params must be an object or array"});
        }
        parsed_params = params_node;
    }

    return JsonRpcRequest(
        method_node.get<std::string>(),
        *parsed_id,
        parsed_params);
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcNotification
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcNotification::JsonRpcNotification(std::string method,
                                         std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcNotification::method() const noexcept {
    return method_;
}

const std::optional<Json>& JsonRpcNotification::params() const noexcept {
    return params_;
}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonResult<JsonRpcError> JsonRpcError::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "error must be a JSON object"});
    }

    const auto code = payload.find("code");
    if (code == payload.end() || code->is_number_integer() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "error.code must be an integer"});
    }

    JsonRpcError error;
    error.code = code->get<std::int64_t>();

    // Some servers omit the message; keep the code.
    const auto message = payload.find("message");
    if (message != payload.end() && message->is_string()) {
        error.message = message->get<std::string>();
    }
    if (payload.contains("data")) {
        error.data = payload.at("data");
    }
    return error;
}

// ─────────────────────────────────────────────────────────────────────────────
// Incoming Messages
// ─────────────────────────────────────────────────────────────────────────────

JsonResult<IncomingMessage> parse_incoming(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidParams,
            "payload must be a JSON object"});
    }

    auto version = check_version(payload);
    if (version.has_value() == false) {
        return tl::unexpected(version.error());
    }

    const auto method = payload.find("method");
    if (method != payload.end()) {
        if (method->is_string() == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidParams,
                "method must be a string"});
        }

        const auto id = payload.find("id");
        if (id == payload.end() || id->is_null()) {
            return JsonRpcServerNotification{method->get<std::string>(), params_or_empty(payload)};
        }

        auto parsed_id = parse_id_field(*id);
        if (parsed_id.has_value() == false) {
            return tl::unexpected(parsed_id.error());
        }
        return JsonRpcServerRequest{*parsed_id, method->get<std::string>(), params_or_empty(payload)};
    }

    // No method: must be a response.
    const auto id = payload.find("id");
    if (id == payload.end()) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "message has neither method nor id"});
    }

    JsonRpcResponse response;
    if (id->is_null() == false) {
        auto parsed_id = parse_id_field(*id);
        if (parsed_id.has_value() == false) {
            return tl::unexpected(parsed_id.error());
        }
        response.id = *parsed_id;
    }

    const auto error = payload.find("error");
    if (error != payload.end()) {
        auto parsed_error = JsonRpcError::from_json(*error);
        if (parsed_error.has_value() == false) {
            return tl::unexpected(parsed_error.error());
        }
        response.error = std::move(*parsed_error);
        return response;
    }

    const auto result = payload.find("result");
    if (result == payload.end()) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "response has neither result nor error"});
    }
    response.result = *result;
    return response;
}

Json make_response(const JsonRpcId& id, Json result) {
    return Json{
        {"jsonrpc", kJsonRpcVersion},
        {"id", id.to_json()},
        {"result", std::move(result)}
    };
}

Json make_error_response(const JsonRpcId& id, const JsonRpcError& error) {
    return Json{
        {"jsonrpc", kJsonRpcVersion},
        {"id", id.to_json()},
        {"error", error.to_json()}
    };
}

}  // namespace mcphub
