#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Error
// ═══════════════════════════════════════════════════════════════════════════
// One error type for connections, the manager and the integration layer.
// Nothing here is process-fatal: every failure is returned to the caller
// that triggered it.

#include "mcphub/protocol/json_rpc.hpp"
#include "mcphub/transport.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcphub {

enum class ClientErrorCode {
    ConfigError,        ///< Malformed server entry (skipped)
    TransportError,     ///< Spawn failure, stream or HTTP failure
    Timeout,            ///< No correlated response within the deadline
    RpcError,           ///< Server returned a JSON-RPC error
    ToolNotFound,
    ResourceNotFound,
    PromptNotFound,
    ServerUnavailable,  ///< Target connection not Connected at call time
    MalformedMessage,   ///< Unparsable inbound message
    ProtocolError,      ///< Well-formed JSON that violates the protocol
    Busy                ///< Rejected while a refresh is in progress
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::ConfigError:       return "ConfigError";
        case ClientErrorCode::TransportError:    return "TransportError";
        case ClientErrorCode::Timeout:           return "Timeout";
        case ClientErrorCode::RpcError:          return "RpcError";
        case ClientErrorCode::ToolNotFound:      return "ToolNotFound";
        case ClientErrorCode::ResourceNotFound:  return "ResourceNotFound";
        case ClientErrorCode::PromptNotFound:    return "PromptNotFound";
        case ClientErrorCode::ServerUnavailable: return "ServerUnavailable";
        case ClientErrorCode::MalformedMessage:  return "MalformedMessage";
        case ClientErrorCode::ProtocolError:     return "ProtocolError";
        case ClientErrorCode::Busy:              return "Busy";
    }
    return "Unknown";
}

struct ClientError {
    ClientErrorCode code;
    std::string message;
    std::optional<JsonRpcError> rpc_error;  ///< Original error if from server
    std::optional<std::string> server_id;

    /// "<code>: <message>", prefixed with the server when known.
    [[nodiscard]] std::string describe() const {
        std::string text;
        if (server_id) {
            text += "[" + *server_id + "] ";
        }
        text += std::string(to_string(code)) + ": " + message;
        return text;
    }

    ClientError& on_server(std::string id) {
        server_id = std::move(id);
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ClientError config_error(std::string msg) {
        return {ClientErrorCode::ConfigError, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ClientError transport_error(std::string msg) {
        return {ClientErrorCode::TransportError, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ClientError timeout(std::string msg) {
        return {ClientErrorCode::Timeout, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ClientError from_rpc_error(const JsonRpcError& err) {
        return {ClientErrorCode::RpcError, err.message, err, std::nullopt};
    }

    [[nodiscard]] static ClientError tool_not_found(const std::string& name) {
        return {ClientErrorCode::ToolNotFound, "Tool not found: " + name, std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ClientError resource_not_found(const std::string& uri) {
        return {ClientErrorCode::ResourceNotFound, "Resource not found: " + uri, std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ClientError prompt_not_found(const std::string& name) {
        return {ClientErrorCode::PromptNotFound, "Prompt not found: " + name, std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ClientError server_unavailable(std::string msg) {
        return {ClientErrorCode::ServerUnavailable, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ClientError malformed_message(std::string msg) {
        return {ClientErrorCode::MalformedMessage, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ClientError protocol_error(std::string msg) {
        return {ClientErrorCode::ProtocolError, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ClientError busy(std::string msg) {
        return {ClientErrorCode::Busy, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ClientError from_transport(const mcphub::TransportError& err) {
        if (err.category == mcphub::TransportError::Category::Timeout) {
            return timeout(err.message);
        }
        return transport_error(err.message);
    }
};

template <typename T>
using ClientResult = tl::expected<T, ClientError>;

}  // namespace mcphub
