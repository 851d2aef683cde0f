#ifndef MCPHUB_CONFIG_HUB_CONFIG_HPP
#define MCPHUB_CONFIG_HUB_CONFIG_HPP

#include "mcphub/log/logger.hpp"

#include <nlohmann/json.hpp>

#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// Server Entries
// ─────────────────────────────────────────────────────────────────────────────

enum class TransportKind {
    Process,  // spawn `command args...`, NDJSON over stdio
    Remote    // HTTP POST to `url`
};

[[nodiscard]] constexpr std::string_view to_string(TransportKind kind) noexcept {
    switch (kind) {
        case TransportKind::Process: return "process";
        case TransportKind::Remote:  return "remote";
    }
    return "unknown";
}

struct ServerConfig {
    std::string id;
    TransportKind kind{TransportKind::Process};

    // Process
    std::string command;
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env;

    // Remote
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;

    std::chrono::seconds timeout{300};

    /// Carried for the host; never enforced here.
    std::vector<std::string> auto_approve;
};

// ─────────────────────────────────────────────────────────────────────────────
// Hub Settings
// ─────────────────────────────────────────────────────────────────────────────

struct HubSettings {
    std::string client_name{"mcphub"};
    std::string client_version{"0.1.0"};

    LogLevel log_level{LogLevel::Info};
    std::string log_file;  // empty = console only

    /// Entries kept by the integration call log.
    std::size_t call_log_capacity{1000};

    /// SIGTERM -> SIGKILL grace for process servers.
    std::chrono::milliseconds shutdown_grace{2000};
};

/// Servers whose tools are emphasised in listings. Presentation only.
[[nodiscard]] std::vector<std::string> default_priority_servers();

/// One skipped or corrected entry. Parsing keeps going past these.
struct ConfigIssue {
    std::string server_id;  // empty for file-level issues
    std::string message;
};

struct HubConfig {
    std::vector<ServerConfig> servers;  // configured order
    HubSettings settings;
    std::vector<std::string> priority_servers{default_priority_servers()};
    std::vector<ConfigIssue> issues;

    [[nodiscard]] const ServerConfig* find_server(std::string_view id) const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────────────────────────────────────
// Shape:
//   {
//     "mcpServers": {
//       "<id>": { "type": "process"|"remote", "command": "...", "args": [...],
//                 "env": {...}, "url": "...", "headers": {...},
//                 "timeout_seconds": 300, "autoApprove": [...] }
//     },
//     "settings":   { "clientName", "clientVersion", "logLevel", "logFile",
//                     "callLogCapacity", "shutdownGraceMs" },
//     "priorities": { "highPriorityServers": [...] }
//   }
//
// Key order in "mcpServers" is the configured order. Aliases: "stdio" and
// "command" for process, "http" and "sse" for remote, "timeout" for
// "timeout_seconds". Without "type" the kind follows from "command"/"url".
//
// A malformed server entry becomes a ConfigIssue and is skipped; only an
// unreadable file or a non-object document fails the whole load.

struct ConfigError {
    std::string message;
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

[[nodiscard]] ConfigResult<HubConfig> parse_hub_config(const nlohmann::ordered_json& document);
[[nodiscard]] ConfigResult<HubConfig> parse_hub_config_text(std::string_view text);
[[nodiscard]] ConfigResult<HubConfig> load_hub_config(const std::filesystem::path& path);

}  // namespace mcphub

#endif  // MCPHUB_CONFIG_HUB_CONFIG_HPP
