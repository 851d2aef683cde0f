#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared by the process and remote transports.
//
// For the transport interface, use: #include "mcphub/transport/transport.hpp"

#include <nlohmann/json.hpp>

#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcphub {

using Json = nlohmann::json;

/// Error type for transport operations.
///
/// An error carrying `request_id` belongs to that single outgoing request
/// (an HTTP failure, for instance) and leaves the transport usable. An error
/// without one, received from `async_receive()`, means the stream is gone.
struct TransportError {
    enum class Category { Network, Timeout, Protocol, Closed };

    Category category{};
    std::string message;
    std::optional<int> status_code{};
    std::optional<std::uint64_t> request_id{};
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Network:  return "network";
        case TransportError::Category::Timeout:  return "timeout";
        case TransportError::Category::Protocol: return "protocol";
        case TransportError::Category::Closed:   return "closed";
    }
    return "unknown";
}

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace mcphub
