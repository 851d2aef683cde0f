#include "mcphub/client/catalog.hpp"
#include "mcphub/log/logger.hpp"

#include <algorithm>

namespace mcphub {

namespace {

template <typename Descriptor, typename Item>
void add_unique(
    std::vector<Descriptor>& out,
    std::unordered_map<std::string, std::size_t>& index,
    const std::string& server_id,
    const Item& item
) {
    Descriptor descriptor{server_id, item};
    auto key = descriptor.qualified_id();
    if (index.contains(key)) {
        MCPHUB_LOG_DEBUG("[{}] duplicate catalog entry {} ignored", server_id, key);
        return;
    }
    index.emplace(std::move(key), out.size());
    out.push_back(std::move(descriptor));
}

template <typename Descriptor, typename Matches>
const Descriptor* lookup(
    const std::vector<Descriptor>& entries,
    const std::unordered_map<std::string, std::size_t>& index,
    std::string_view name,
    Matches matches
) {
    if (const auto it = index.find(std::string(name)); it != index.end()) {
        return &entries[it->second];
    }
    // Configured order: entries are stored server by server.
    const auto found = std::find_if(entries.begin(), entries.end(), matches);
    return (found != entries.end()) ? &*found : nullptr;
}

}  // namespace

std::string make_qualified_id(std::string_view server_id, std::string_view name) {
    std::string id;
    id.reserve(server_id.size() + 1 + name.size());
    id.append(server_id);
    id.push_back('/');
    id.append(name);
    return id;
}

// ─────────────────────────────────────────────────────────────────────────────
// Descriptors
// ─────────────────────────────────────────────────────────────────────────────

Json ToolDescriptor::to_json() const {
    return {
        {"id", qualified_id()},
        {"name", tool.name},
        {"description", tool.description.value_or("")},
        {"server", server_id},
        {"inputSchema", tool.input_schema}
    };
}

Json ResourceDescriptor::to_json() const {
    Json j = {
        {"id", qualified_id()},
        {"uri", resource.uri},
        {"name", resource.name},
        {"description", resource.description.value_or("")},
        {"server", server_id}
    };
    if (resource.mime_type) {
        j["mimeType"] = *resource.mime_type;
    }
    return j;
}

Json PromptDescriptor::to_json() const {
    Json j = prompt.to_json();
    j["id"] = qualified_id();
    j["server"] = server_id;
    return j;
}

// ─────────────────────────────────────────────────────────────────────────────
// CatalogSnapshot
// ─────────────────────────────────────────────────────────────────────────────

CatalogSnapshot CatalogSnapshot::build(const std::vector<Source>& servers) {
    CatalogSnapshot snapshot;
    for (const auto& [server_id, catalog] : servers) {
        for (const auto& tool : catalog.tools) {
            add_unique(snapshot.tools_, snapshot.tool_index_, server_id, tool);
        }
        for (const auto& resource : catalog.resources) {
            add_unique(snapshot.resources_, snapshot.resource_index_, server_id, resource);
        }
        for (const auto& prompt : catalog.prompts) {
            add_unique(snapshot.prompts_, snapshot.prompt_index_, server_id, prompt);
        }
    }
    return snapshot;
}

const ToolDescriptor* CatalogSnapshot::find_tool(std::string_view name) const {
    return lookup(tools_, tool_index_, name,
        [name](const ToolDescriptor& d) { return d.tool.name == name; });
}

const ResourceDescriptor* CatalogSnapshot::find_resource(std::string_view uri) const {
    return lookup(resources_, resource_index_, uri,
        [uri](const ResourceDescriptor& d) { return d.resource.uri == uri; });
}

const PromptDescriptor* CatalogSnapshot::find_prompt(std::string_view name) const {
    return lookup(prompts_, prompt_index_, name,
        [name](const PromptDescriptor& d) { return d.prompt.name == name; });
}

}  // namespace mcphub
