#include "mcphub/config/hub_config.hpp"
#include "mcphub/transport/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace mcphub {

namespace {

using OrderedJson = nlohmann::ordered_json;

template <typename T>
using EntryResult = tl::expected<T, std::string>;

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

const OrderedJson* find_field(const OrderedJson& object, const char* key) {
    const auto it = object.find(key);
    return (it != object.end() && it->is_null() == false) ? &*it : nullptr;
}

EntryResult<std::vector<std::string>> string_array(const OrderedJson& node, const char* what) {
    if (node.is_array() == false) {
        return tl::unexpected(std::string(what) + " must be an array of strings");
    }
    std::vector<std::string> values;
    for (const auto& item : node) {
        if (item.is_string() == false) {
            return tl::unexpected(std::string(what) + " must contain only strings");
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

EntryResult<std::vector<std::pair<std::string, std::string>>> string_map(
    const OrderedJson& node,
    const char* what
) {
    if (node.is_object() == false) {
        return tl::unexpected(std::string(what) + " must be an object");
    }
    std::vector<std::pair<std::string, std::string>> values;
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (it.value().is_string()) {
            values.emplace_back(it.key(), it.value().get<std::string>());
        } else if (it.value().is_number() || it.value().is_boolean()) {
            // PORT=8080 written as a number is common in the wild.
            values.emplace_back(it.key(), it.value().dump());
        } else {
            return tl::unexpected(std::string(what) + "." + it.key() + " must be a string");
        }
    }
    return values;
}

EntryResult<TransportKind> resolve_kind(const OrderedJson& entry) {
    if (const auto* type = find_field(entry, "type")) {
        if (type->is_string() == false) {
            return tl::unexpected(std::string("type must be a string"));
        }
        const auto name = lowercase(type->get<std::string>());
        if (name == "process" || name == "stdio" || name == "command") {
            return TransportKind::Process;
        }
        if (name == "remote" || name == "http" || name == "sse" || name == "streamable-http") {
            return TransportKind::Remote;
        }
        return tl::unexpected("unknown transport type '" + type->get<std::string>() + "'");
    }

    if (find_field(entry, "command") != nullptr) {
        return TransportKind::Process;
    }
    if (find_field(entry, "url") != nullptr) {
        return TransportKind::Remote;
    }
    return tl::unexpected(std::string("entry needs a command or a url"));
}

// One day; longer deadlines are configuration mistakes.
constexpr double kMaxTimeoutSeconds = 86400.0;

EntryResult<std::chrono::seconds> parse_timeout(const OrderedJson& entry) {
    const auto* node = find_field(entry, "timeout_seconds");
    if (node == nullptr) {
        node = find_field(entry, "timeout");
    }
    if (node == nullptr) {
        return std::chrono::seconds(300);
    }
    if (node->is_number() == false || node->get<double>() <= 0.0) {
        return tl::unexpected(std::string("timeout must be a positive number of seconds"));
    }
    if (node->get<double>() > kMaxTimeoutSeconds) {
        return tl::unexpected(std::string("timeout must not exceed 86400 seconds"));
    }
    return std::chrono::seconds(static_cast<std::int64_t>(std::ceil(node->get<double>())));
}

EntryResult<ServerConfig> parse_server(const std::string& id, const OrderedJson& entry) {
    if (id.empty()) {
        return tl::unexpected(std::string("server id must not be empty"));
    }
    if (entry.is_object() == false) {
        return tl::unexpected(std::string("entry must be an object"));
    }

    ServerConfig server;
    server.id = id;

    auto kind = resolve_kind(entry);
    if (!kind) {
        return tl::unexpected(kind.error());
    }
    server.kind = *kind;

    if (server.kind == TransportKind::Process) {
        const auto* command = find_field(entry, "command");
        if (command == nullptr || command->is_string() == false || command->get<std::string>().empty()) {
            return tl::unexpected(std::string("process entry needs a non-empty command"));
        }
        server.command = command->get<std::string>();

        if (const auto* args = find_field(entry, "args")) {
            auto parsed = string_array(*args, "args");
            if (!parsed) {
                return tl::unexpected(parsed.error());
            }
            server.args = std::move(*parsed);
        }
        if (const auto* env = find_field(entry, "env")) {
            auto parsed = string_map(*env, "env");
            if (!parsed) {
                return tl::unexpected(parsed.error());
            }
            server.env = std::move(*parsed);
        }
    } else {
        const auto* url = find_field(entry, "url");
        if (url == nullptr || url->is_string() == false) {
            return tl::unexpected(std::string("remote entry needs a url"));
        }
        server.url = url->get<std::string>();
        if (parse_url(server.url).has_value() == false) {
            return tl::unexpected("invalid url '" + server.url + "'");
        }

        if (const auto* headers = find_field(entry, "headers")) {
            auto parsed = string_map(*headers, "headers");
            if (!parsed) {
                return tl::unexpected(parsed.error());
            }
            server.headers = std::move(*parsed);
        }
    }

    auto timeout = parse_timeout(entry);
    if (!timeout) {
        return tl::unexpected(timeout.error());
    }
    server.timeout = *timeout;

    if (const auto* approve = find_field(entry, "autoApprove")) {
        auto parsed = string_array(*approve, "autoApprove");
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        server.auto_approve = std::move(*parsed);
    }

    return server;
}

void parse_settings(const OrderedJson& node, HubConfig& config) {
    if (node.is_object() == false) {
        config.issues.push_back({"", "settings must be an object"});
        return;
    }
    auto& settings = config.settings;

    if (const auto* name = find_field(node, "clientName"); name && name->is_string()) {
        settings.client_name = name->get<std::string>();
    }
    if (const auto* version = find_field(node, "clientVersion"); version && version->is_string()) {
        settings.client_version = version->get<std::string>();
    }
    if (const auto* level = find_field(node, "logLevel")) {
        const auto parsed = level->is_string()
            ? parse_log_level(level->get<std::string>())
            : std::nullopt;
        if (parsed) {
            settings.log_level = *parsed;
        } else {
            config.issues.push_back({"", "settings.logLevel is not a known level"});
        }
    }
    if (const auto* file = find_field(node, "logFile"); file && file->is_string()) {
        settings.log_file = file->get<std::string>();
    }
    if (const auto* capacity = find_field(node, "callLogCapacity")) {
        if (capacity->is_number_unsigned()) {
            settings.call_log_capacity = capacity->get<std::size_t>();
        } else {
            config.issues.push_back({"", "settings.callLogCapacity must be a non-negative integer"});
        }
    }
    if (const auto* grace = find_field(node, "shutdownGraceMs")) {
        if (grace->is_number_unsigned()) {
            settings.shutdown_grace = std::chrono::milliseconds(grace->get<std::int64_t>());
        } else {
            config.issues.push_back({"", "settings.shutdownGraceMs must be a non-negative integer"});
        }
    }
}

void parse_priorities(const OrderedJson& node, HubConfig& config) {
    if (node.is_object() == false) {
        config.issues.push_back({"", "priorities must be an object"});
        return;
    }
    if (const auto* servers = find_field(node, "highPriorityServers")) {
        auto parsed = string_array(*servers, "priorities.highPriorityServers");
        if (parsed) {
            config.priority_servers = std::move(*parsed);
        } else {
            config.issues.push_back({"", parsed.error()});
        }
    }
}

}  // namespace

std::vector<std::string> default_priority_servers() {
    return {"desktop-commander", "filesystem", "memory", "playwright", "windows-mcp", "pieces"};
}

const ServerConfig* HubConfig::find_server(std::string_view id) const {
    const auto it = std::find_if(servers.begin(), servers.end(),
                                 [id](const ServerConfig& s) { return s.id == id; });
    return (it != servers.end()) ? &*it : nullptr;
}

ConfigResult<HubConfig> parse_hub_config(const nlohmann::ordered_json& document) {
    if (document.is_object() == false) {
        return tl::unexpected(ConfigError{"configuration must be a JSON object"});
    }

    HubConfig config;

    const auto* servers = find_field(document, "mcpServers");
    if (servers == nullptr) {
        config.issues.push_back({"", "no mcpServers section"});
    } else if (servers->is_object() == false) {
        config.issues.push_back({"", "mcpServers must be an object"});
    } else {
        for (auto it = servers->begin(); it != servers->end(); ++it) {
            auto server = parse_server(it.key(), it.value());
            if (!server) {
                MCPHUB_LOG_WARN("Skipping server '{}': {}", it.key(), server.error());
                config.issues.push_back({it.key(), server.error()});
                continue;
            }
            config.servers.push_back(std::move(*server));
        }
    }

    if (const auto* settings = find_field(document, "settings")) {
        parse_settings(*settings, config);
    }
    if (const auto* priorities = find_field(document, "priorities")) {
        parse_priorities(*priorities, config);
    }

    return config;
}

ConfigResult<HubConfig> parse_hub_config_text(std::string_view text) {
    nlohmann::ordered_json document;
    try {
        document = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::ordered_json::parse_error& e) {
        return tl::unexpected(ConfigError{"invalid JSON: " + std::string(e.what())});
    }
    return parse_hub_config(document);
}

ConfigResult<HubConfig> load_hub_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (file.is_open() == false) {
        return tl::unexpected(ConfigError{"cannot open " + path.string()});
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_hub_config_text(buffer.str());
    if (!config) {
        return tl::unexpected(ConfigError{path.string() + ": " + config.error().message});
    }
    MCPHUB_LOG_INFO("Loaded {} server(s) from {}", config->servers.size(), path.string());
    return config;
}

}  // namespace mcphub
