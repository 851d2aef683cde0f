#pragma once

#include "mcphub/transport.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// LineFramer
// ─────────────────────────────────────────────────────────────────────────────
// Splits a byte stream into newline-terminated lines. A read may end in the
// middle of a line; the remainder stays buffered until the next feed().
//
// Lines longer than the limit are dropped whole (the framer skips to the next
// newline) and counted in dropped(). A trailing '\r' is stripped and blank
// lines are skipped.

class LineFramer {
public:
    static constexpr std::size_t kDefaultMaxLineSize = 4 * 1024 * 1024;

    explicit LineFramer(std::size_t max_line_size = kDefaultMaxLineSize)
        : max_line_size_(max_line_size)
    {}

    [[nodiscard]] std::vector<std::string> feed(std::string_view chunk);

    /// Bytes held for an incomplete line.
    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size(); }

    [[nodiscard]] std::size_t dropped() const noexcept { return dropped_; }

    void reset() noexcept;

private:
    void complete_line(std::vector<std::string>& out);

    std::size_t max_line_size_;
    std::string buffer_;
    bool discarding_{false};
    std::size_t dropped_{0};
};

/// Parse one framed line into a JSON-RPC envelope. Anything but a JSON object
/// or array is rejected with a Protocol error.
[[nodiscard]] TransportResult<Json> decode_line(std::string_view line);

}  // namespace mcphub
