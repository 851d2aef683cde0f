#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// Headers
// ─────────────────────────────────────────────────────────────────────────────
// Header names compare case-insensitively (RFC 7230).

using HeaderMap = std::unordered_map<std::string, std::string>;

inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) {
            const auto& key = pair.first;
            return key.size() == name.size() &&
                   std::ranges::equal(key, name,
                       [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) ==
                                  std::tolower(static_cast<unsigned char>(b));
                       });
        });
}

inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

/// Insert or replace, matching an existing name case-insensitively.
inline void set_header(HeaderMap& headers, const std::string& name, std::string value) {
    const auto it = find_header(headers, name);
    if (it != headers.end()) {
        headers.erase(it);
    }
    headers.emplace(name, std::move(value));
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::uint16_t port{0};
    std::string path;     // always starts with '/'
    std::string query;    // includes '?' when present
};

/// WHATWG parse via ada; only http and https with a host are accepted.
[[nodiscard]] std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace mcphub
