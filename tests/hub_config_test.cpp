// ─────────────────────────────────────────────────────────────────────────────
// Hub Configuration Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcphub/config/hub_config.hpp"

#include <filesystem>
#include <fstream>

using namespace mcphub;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// Server Entries
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Servers keep the order they are written in", "[config]") {
    auto config = parse_hub_config_text(R"({
        "mcpServers": {
            "zeta":  { "command": "zeta-server" },
            "alpha": { "command": "alpha-server" },
            "mid":   { "url": "http://localhost:8080/mcp" }
        }
    })");

    REQUIRE(config.has_value());
    REQUIRE(config->servers.size() == 3);
    REQUIRE(config->servers[0].id == "zeta");
    REQUIRE(config->servers[1].id == "alpha");
    REQUIRE(config->servers[2].id == "mid");
    REQUIRE(config->issues.empty());
}

TEST_CASE("Process entries carry command, args and env", "[config]") {
    auto config = parse_hub_config_text(R"({
        "mcpServers": {
            "files": {
                "type": "stdio",
                "command": "npx",
                "args": ["-y", "@modelcontextprotocol/server-filesystem", "/tmp"],
                "env": { "DEBUG": "1", "PORT": 8080 },
                "timeout_seconds": 30,
                "autoApprove": ["read_file"]
            }
        }
    })");

    REQUIRE(config.has_value());
    const auto* files = config->find_server("files");
    REQUIRE(files != nullptr);
    REQUIRE(files->kind == TransportKind::Process);
    REQUIRE(files->command == "npx");
    REQUIRE(files->args.size() == 3);
    REQUIRE(files->env.size() == 2);
    REQUIRE(files->env[1].first == "PORT");
    REQUIRE(files->env[1].second == "8080");
    REQUIRE(files->timeout == 30s);
    REQUIRE(files->auto_approve == std::vector<std::string>{"read_file"});
}

TEST_CASE("Remote entries carry url and headers", "[config]") {
    auto config = parse_hub_config_text(R"({
        "mcpServers": {
            "search": {
                "type": "http",
                "url": "https://search.example.com/mcp",
                "headers": { "Authorization": "Bearer abc" },
                "timeout": 2.5
            }
        }
    })");

    REQUIRE(config.has_value());
    const auto& search = config->servers.at(0);
    REQUIRE(search.kind == TransportKind::Remote);
    REQUIRE(search.url == "https://search.example.com/mcp");
    REQUIRE(search.headers.size() == 1);
    REQUIRE(search.headers[0].second == "Bearer abc");
    REQUIRE(search.timeout == 3s);
}

TEST_CASE("Timeout defaults to five minutes", "[config]") {
    auto config = parse_hub_config_text(R"({"mcpServers": {"a": {"command": "a"}}})");

    REQUIRE(config.has_value());
    REQUIRE(config->servers[0].timeout == 300s);
}

TEST_CASE("Malformed entries are skipped and reported", "[config]") {
    auto config = parse_hub_config_text(R"({
        "mcpServers": {
            "good":     { "command": "ok" },
            "nothing":  { },
            "badtype":  { "type": "carrier-pigeon", "command": "x" },
            "emptycmd": { "type": "process", "command": "" },
            "badurl":   { "type": "remote", "url": "not a url" },
            "badargs":  { "command": "x", "args": "one two" },
            "badtime":  { "command": "x", "timeout_seconds": -1 },
            "scalar":   42,
            "last":     { "command": "also-ok" }
        }
    })");

    REQUIRE(config.has_value());
    REQUIRE(config->servers.size() == 2);
    REQUIRE(config->servers[0].id == "good");
    REQUIRE(config->servers[1].id == "last");
    REQUIRE(config->issues.size() == 7);
    REQUIRE(config->issues[0].server_id == "nothing");
    REQUIRE(config->find_server("badtype") == nullptr);
}

TEST_CASE("Timeouts beyond one day are rejected", "[config]") {
    auto config = parse_hub_config_text(R"({
        "mcpServers": {
            "day":     { "command": "x", "timeout": 86400 },
            "huge":    { "command": "x", "timeout_seconds": 1e16 },
            "absurd":  { "command": "x", "timeout": 1e300 }
        }
    })");

    REQUIRE(config.has_value());
    REQUIRE(config->servers.size() == 1);
    REQUIRE(config->servers[0].timeout == 86400s);
    REQUIRE(config->issues.size() == 2);
    REQUIRE(config->issues[0].server_id == "huge");
    REQUIRE(config->issues[1].message.find("86400") != std::string::npos);
}

TEST_CASE("A missing mcpServers section is an issue, not a failure", "[config]") {
    auto config = parse_hub_config_text(R"({"settings": {}})");

    REQUIRE(config.has_value());
    REQUIRE(config->servers.empty());
    REQUIRE(config->issues.size() == 1);
}

TEST_CASE("Unreadable documents fail the load", "[config]") {
    REQUIRE_FALSE(parse_hub_config_text("{ not json").has_value());
    REQUIRE_FALSE(parse_hub_config_text("[1, 2]").has_value());
    REQUIRE_FALSE(load_hub_config("/nonexistent/mcphub/servers.json").has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Settings and Priorities
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Settings override defaults", "[config]") {
    auto config = parse_hub_config_text(R"({
        "mcpServers": {},
        "settings": {
            "clientName": "my-host",
            "clientVersion": "2.0.0",
            "logLevel": "debug",
            "logFile": "/tmp/mcphub.log",
            "callLogCapacity": 10,
            "shutdownGraceMs": 500
        }
    })");

    REQUIRE(config.has_value());
    const auto& settings = config->settings;
    REQUIRE(settings.client_name == "my-host");
    REQUIRE(settings.client_version == "2.0.0");
    REQUIRE(settings.log_level == LogLevel::Debug);
    REQUIRE(settings.log_file == "/tmp/mcphub.log");
    REQUIRE(settings.call_log_capacity == 10);
    REQUIRE(settings.shutdown_grace == 500ms);
    REQUIRE(config->issues.empty());
}

TEST_CASE("Bad settings keep defaults and are reported", "[config]") {
    auto config = parse_hub_config_text(R"({
        "mcpServers": {},
        "settings": { "logLevel": "loud", "callLogCapacity": -5 }
    })");

    REQUIRE(config.has_value());
    REQUIRE(config->settings.log_level == LogLevel::Info);
    REQUIRE(config->settings.call_log_capacity == 1000);
    REQUIRE(config->issues.size() == 2);
}

TEST_CASE("Priority servers default to the built-in list", "[config]") {
    auto config = parse_hub_config_text(R"({"mcpServers": {}})");

    REQUIRE(config.has_value());
    REQUIRE(config->priority_servers == default_priority_servers());
    REQUIRE(config->priority_servers.front() == "desktop-commander");
}

TEST_CASE("Priority servers can be replaced", "[config]") {
    auto config = parse_hub_config_text(R"({
        "mcpServers": {},
        "priorities": { "highPriorityServers": ["search", "files"] }
    })");

    REQUIRE(config.has_value());
    REQUIRE(config->priority_servers == std::vector<std::string>{"search", "files"});
}

// ═══════════════════════════════════════════════════════════════════════════
// Files
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Configuration loads from a file", "[config]") {
    const auto path = std::filesystem::temp_directory_path() / "mcphub_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"mcpServers": {"files": {"command": "files-server"}}})";
    }

    auto config = load_hub_config(path);

    REQUIRE(config.has_value());
    REQUIRE(config->servers.size() == 1);
    REQUIRE(config->servers[0].command == "files-server");

    std::filesystem::remove(path);
}

TEST_CASE("File errors name the path", "[config]") {
    const auto path = std::filesystem::temp_directory_path() / "mcphub_config_broken.json";
    {
        std::ofstream out(path);
        out << "{ broken";
    }

    auto config = load_hub_config(path);

    REQUIRE_FALSE(config.has_value());
    REQUIRE(config.error().message.find(path.string()) != std::string::npos);

    std::filesystem::remove(path);
}
