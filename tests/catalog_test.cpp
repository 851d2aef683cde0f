// ─────────────────────────────────────────────────────────────────────────────
// CatalogSnapshot Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcphub/client/catalog.hpp"

using namespace mcphub;

namespace {

Tool tool_named(std::string name, std::string description = "") {
    Tool tool;
    tool.name = std::move(name);
    if (description.empty() == false) {
        tool.description = std::move(description);
    }
    return tool;
}

Resource resource_at(std::string uri) {
    Resource resource;
    resource.uri = std::move(uri);
    resource.name = resource.uri;
    return resource;
}

std::vector<CatalogSnapshot::Source> two_servers() {
    ServerCatalog files;
    files.tools = {tool_named("read_file", "files"), tool_named("search")};
    files.resources = {resource_at("file:///notes.txt")};

    ServerCatalog web;
    web.tools = {tool_named("search", "web"), tool_named("fetch")};
    web.prompts = {Prompt{"summarize", std::nullopt, {}}};

    return {{"files", files}, {"web", web}};
}

}  // namespace

TEST_CASE("Qualified ids join server and name with a slash", "[catalog]") {
    REQUIRE(make_qualified_id("files", "read_file") == "files/read_file");
    REQUIRE(make_qualified_id("files", "file:///notes.txt") == "files/file:///notes.txt");
}

TEST_CASE("Snapshot keeps configured server order", "[catalog]") {
    auto snapshot = CatalogSnapshot::build(two_servers());

    REQUIRE(snapshot.tools().size() == 4);
    REQUIRE(snapshot.tools()[0].qualified_id() == "files/read_file");
    REQUIRE(snapshot.tools()[1].qualified_id() == "files/search");
    REQUIRE(snapshot.tools()[2].qualified_id() == "web/search");
    REQUIRE(snapshot.tools()[3].qualified_id() == "web/fetch");
    REQUIRE(snapshot.resources().size() == 1);
    REQUIRE(snapshot.prompts().size() == 1);
}

TEST_CASE("Lookup prefers the exact qualified id", "[catalog]") {
    auto snapshot = CatalogSnapshot::build(two_servers());

    const auto* web_search = snapshot.find_tool("web/search");
    REQUIRE(web_search != nullptr);
    REQUIRE(web_search->server_id == "web");
    REQUIRE(web_search->tool.description == "web");
}

TEST_CASE("Bare names resolve to the first configured server", "[catalog]") {
    auto snapshot = CatalogSnapshot::build(two_servers());

    const auto* search = snapshot.find_tool("search");
    REQUIRE(search != nullptr);
    REQUIRE(search->server_id == "files");

    const auto* fetch = snapshot.find_tool("fetch");
    REQUIRE(fetch != nullptr);
    REQUIRE(fetch->server_id == "web");

    REQUIRE(snapshot.find_tool("missing") == nullptr);
    REQUIRE(snapshot.find_tool("other/search") == nullptr);
}

TEST_CASE("Resources and prompts resolve by qualified id or bare key", "[catalog]") {
    auto snapshot = CatalogSnapshot::build(two_servers());

    REQUIRE(snapshot.find_resource("file:///notes.txt") != nullptr);
    REQUIRE(snapshot.find_resource("files/file:///notes.txt") != nullptr);
    REQUIRE(snapshot.find_prompt("summarize")->server_id == "web");
    REQUIRE(snapshot.find_prompt("files/summarize") == nullptr);
}

TEST_CASE("A server reporting a name twice keeps the first entry", "[catalog]") {
    ServerCatalog catalog;
    catalog.tools = {tool_named("echo", "first"), tool_named("echo", "second")};

    auto snapshot = CatalogSnapshot::build(std::vector<CatalogSnapshot::Source>{{"alpha", catalog}});

    REQUIRE(snapshot.tools().size() == 1);
    REQUIRE(snapshot.tools()[0].tool.description == "first");
}

TEST_CASE("Rebuilding from the same sources yields an equal snapshot", "[catalog]") {
    auto first = CatalogSnapshot::build(two_servers());
    auto second = CatalogSnapshot::build(two_servers());

    REQUIRE(first == second);

    auto sources = two_servers();
    sources[1].second.tools.pop_back();
    REQUIRE_FALSE(CatalogSnapshot::build(sources) == first);
}

TEST_CASE("Descriptor JSON names the owning server", "[catalog]") {
    auto snapshot = CatalogSnapshot::build(two_servers());

    auto j = snapshot.tools()[2].to_json();
    REQUIRE(j["id"] == "web/search");
    REQUIRE(j["name"] == "search");
    REQUIRE(j["server"] == "web");
    REQUIRE(j["description"] == "web");

    REQUIRE(snapshot.resources()[0].to_json()["id"] == "files/file:///notes.txt");
    REQUIRE(snapshot.prompts()[0].to_json()["server"] == "web");
}

TEST_CASE("Empty snapshot", "[catalog]") {
    CatalogSnapshot snapshot;

    REQUIRE(snapshot.empty());
    REQUIRE(snapshot.find_tool("anything") == nullptr);
}
