#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// Coroutine-based carrier of JSON-RPC envelopes for one server connection.
//
// Contract:
// - async_send() hands one envelope to the wire; concurrent callers are
//   serialized by the implementation.
// - async_receive() yields inbound envelopes in arrival order. Once the
//   stream ends it yields a Closed error without a request id, and keeps
//   doing so.
// - async_stop() is idempotent and makes pending receives complete.

#include "mcphub/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <string>

namespace mcphub {

class ITransport {
public:
    virtual ~ITransport() = default;

    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_start() = 0;

    [[nodiscard]] virtual asio::awaitable<void> async_stop() = 0;

    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_send(Json message) = 0;

    [[nodiscard]] virtual asio::awaitable<TransportResult<Json>> async_receive() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /// Human-readable endpoint (command line or URL) for logs and status.
    [[nodiscard]] virtual std::string describe() const = 0;
};

}  // namespace mcphub
