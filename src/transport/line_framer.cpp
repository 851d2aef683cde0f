#include "mcphub/transport/line_framer.hpp"

#include <algorithm>
#include <cctype>

namespace mcphub {

namespace {

bool is_blank(std::string_view line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

std::vector<std::string> LineFramer::feed(std::string_view chunk) {
    std::vector<std::string> lines;

    while (chunk.empty() == false) {
        const auto newline = chunk.find('\n');
        const bool has_newline = (newline != std::string_view::npos);
        const auto piece = has_newline ? chunk.substr(0, newline) : chunk;

        if (discarding_ == false) {
            buffer_.append(piece);
            if (buffer_.size() > max_line_size_) {
                buffer_.clear();
                discarding_ = true;
                ++dropped_;
            }
        }

        if (has_newline == false) {
            break;
        }

        if (discarding_) {
            discarding_ = false;
        } else {
            complete_line(lines);
        }
        chunk.remove_prefix(newline + 1);
    }

    return lines;
}

void LineFramer::complete_line(std::vector<std::string>& out) {
    if (buffer_.empty() == false && buffer_.back() == '\r') {
        buffer_.pop_back();
    }
    if (is_blank(buffer_) == false) {
        out.push_back(std::move(buffer_));
    }
    buffer_.clear();
}

void LineFramer::reset() noexcept {
    buffer_.clear();
    discarding_ = false;
    dropped_ = 0;
}

TransportResult<Json> decode_line(std::string_view line) {
    Json message;
    try {
        message = Json::parse(line);
    } catch (const Json::parse_error& e) {
        return tl::unexpected(TransportError{
            TransportError::Category::Protocol,
            "Failed to parse JSON: " + std::string(e.what())
        });
    }

    if (message.is_object() == false && message.is_array() == false) {
        return tl::unexpected(TransportError{
            TransportError::Category::Protocol,
            "Message is not a JSON-RPC envelope"
        });
    }
    return message;
}

}  // namespace mcphub
