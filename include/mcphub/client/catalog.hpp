#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Catalog
// ═══════════════════════════════════════════════════════════════════════════
// Descriptors discovered from servers, and the immutable merged snapshot the
// manager publishes after each discovery pass.
//
// Keys are qualified ids ("server/name", "server/uri" for resources). Bare
// names may repeat across servers; lookups by bare name take the first match
// in configured-server order.

#include "mcphub/protocol/mcp_types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mcphub {

[[nodiscard]] std::string make_qualified_id(std::string_view server_id, std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// Descriptors
// ─────────────────────────────────────────────────────────────────────────────

struct ToolDescriptor {
    std::string server_id;
    Tool tool;

    [[nodiscard]] std::string qualified_id() const { return make_qualified_id(server_id, tool.name); }

    /// {id, name, description, server, inputSchema}
    [[nodiscard]] Json to_json() const;

    friend bool operator==(const ToolDescriptor&, const ToolDescriptor&) = default;
};

struct ResourceDescriptor {
    std::string server_id;
    Resource resource;

    [[nodiscard]] std::string qualified_id() const { return make_qualified_id(server_id, resource.uri); }

    [[nodiscard]] Json to_json() const;

    friend bool operator==(const ResourceDescriptor&, const ResourceDescriptor&) = default;
};

struct PromptDescriptor {
    std::string server_id;
    Prompt prompt;

    [[nodiscard]] std::string qualified_id() const { return make_qualified_id(server_id, prompt.name); }

    [[nodiscard]] Json to_json() const;

    friend bool operator==(const PromptDescriptor&, const PromptDescriptor&) = default;
};

/// What one server reported in its last discovery pass.
struct ServerCatalog {
    std::vector<Tool> tools;
    std::vector<Resource> resources;
    std::vector<Prompt> prompts;

    [[nodiscard]] bool empty() const {
        return tools.empty() && resources.empty() && prompts.empty();
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// CatalogSnapshot
// ─────────────────────────────────────────────────────────────────────────────
// Never mutated after build(); the manager replaces the whole snapshot.

class CatalogSnapshot {
public:
    using Source = std::pair<std::string, ServerCatalog>;

    CatalogSnapshot() = default;

    /// `servers` in configured order. A qualified id reported twice by the
    /// same server keeps its first entry.
    [[nodiscard]] static CatalogSnapshot build(const std::vector<Source>& servers);

    [[nodiscard]] const std::vector<ToolDescriptor>& tools() const noexcept { return tools_; }
    [[nodiscard]] const std::vector<ResourceDescriptor>& resources() const noexcept { return resources_; }
    [[nodiscard]] const std::vector<PromptDescriptor>& prompts() const noexcept { return prompts_; }

    /// Exact qualified id first, then the first bare-name match.
    [[nodiscard]] const ToolDescriptor* find_tool(std::string_view name) const;

    /// Exact qualified id first, then the first entry with that URI.
    [[nodiscard]] const ResourceDescriptor* find_resource(std::string_view uri) const;

    [[nodiscard]] const PromptDescriptor* find_prompt(std::string_view name) const;

    [[nodiscard]] bool empty() const noexcept {
        return tools_.empty() && resources_.empty() && prompts_.empty();
    }

    friend bool operator==(const CatalogSnapshot& a, const CatalogSnapshot& b) {
        return a.tools_ == b.tools_ && a.resources_ == b.resources_ && a.prompts_ == b.prompts_;
    }

private:
    std::vector<ToolDescriptor> tools_;
    std::vector<ResourceDescriptor> resources_;
    std::vector<PromptDescriptor> prompts_;

    // qualified id -> index
    std::unordered_map<std::string, std::size_t> tool_index_;
    std::unordered_map<std::string, std::size_t> resource_index_;
    std::unordered_map<std::string, std::size_t> prompt_index_;
};

}  // namespace mcphub
