#ifndef MCPHUB_PROTOCOL_MCP_TYPES_HPP
#define MCPHUB_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcphub {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Version
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

namespace detail {

// Servers are loose about optional fields (null, wrong type); treat anything
// that is not a string as absent.
inline std::optional<std::string> optional_string(const Json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_string() == false) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

inline std::string string_or_empty(const Json& j, const char* key) {
    return optional_string(j, key).value_or("");
}

inline std::optional<std::string> next_cursor(const Json& j) {
    auto cursor = optional_string(j, "nextCursor");
    if (cursor && cursor->empty()) {
        return std::nullopt;
    }
    return cursor;
}

}  // namespace detail

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        if (j.is_object() == false) {
            return {};
        }
        return {
            detail::string_or_empty(j, "name"),
            detail::string_or_empty(j, "version")
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════

// Declared as empty objects: {"tools":{}, "resources":{}, "prompts":{}}.
struct ClientCapabilities {
    bool tools{true};
    bool resources{true};
    bool prompts{true};

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (tools) j["tools"] = Json::object();
        if (resources) j["resources"] = Json::object();
        if (prompts) j["prompts"] = Json::object();
        return j;
    }
};

struct ServerCapabilities {
    struct Prompts {
        bool list_changed = false;
    };
    struct Resources {
        bool subscribe = false;
        bool list_changed = false;
    };
    struct Tools {
        bool list_changed = false;
    };

    std::optional<Prompts> prompts;
    std::optional<Resources> resources;
    std::optional<Tools> tools;
    bool logging{false};
    Json raw = Json::object();

    static ServerCapabilities from_json(const Json& j) {
        ServerCapabilities caps;
        if (j.is_object() == false) {
            return caps;
        }
        caps.raw = j;

        auto flag = [](const Json& section, const char* key) {
            if (section.is_object() == false) return false;
            const auto it = section.find(key);
            return it != section.end() && it->is_boolean() && it->get<bool>();
        };

        if (const auto it = j.find("prompts"); it != j.end()) {
            caps.prompts = Prompts{flag(*it, "listChanged")};
        }
        if (const auto it = j.find("resources"); it != j.end()) {
            caps.resources = Resources{flag(*it, "subscribe"), flag(*it, "listChanged")};
        }
        if (const auto it = j.find("tools"); it != j.end()) {
            caps.tools = Tools{flag(*it, "listChanged")};
        }
        caps.logging = j.contains("logging");
        return caps;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize Request/Response
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    ClientCapabilities capabilities;
    Implementation client_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"clientInfo", client_info.to_json()}
        };
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    static InitializeResult from_json(const Json& j) {
        InitializeResult result;
        if (j.is_object() == false) {
            return result;
        }
        result.protocol_version = detail::string_or_empty(j, "protocolVersion");
        if (const auto it = j.find("capabilities"); it != j.end()) {
            result.capabilities = ServerCapabilities::from_json(*it);
        }
        if (const auto it = j.find("serverInfo"); it != j.end()) {
            result.server_info = Implementation::from_json(*it);
        }
        result.instructions = detail::optional_string(j, "instructions");
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

struct Tool {
    std::string name;
    std::optional<std::string> description;
    Json input_schema = Json::object();  // JSON Schema for tool arguments

    static Tool from_json(const Json& j) {
        Tool tool;
        tool.name = detail::string_or_empty(j, "name");
        tool.description = detail::optional_string(j, "description");
        if (const auto it = j.find("inputSchema"); it != j.end() && it->is_object()) {
            tool.input_schema = *it;
        }
        return tool;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}, {"inputSchema", input_schema}};
        if (description) {
            j["description"] = *description;
        }
        return j;
    }

    friend bool operator==(const Tool&, const Tool&) = default;
};

struct ListToolsResult {
    std::vector<Tool> tools;
    std::optional<std::string> next_cursor;

    static ListToolsResult from_json(const Json& j) {
        ListToolsResult result;
        if (j.is_object() == false) {
            return result;
        }
        if (const auto it = j.find("tools"); it != j.end() && it->is_array()) {
            for (const auto& t : *it) {
                if (t.is_object()) {
                    result.tools.push_back(Tool::from_json(t));
                }
            }
        }
        result.next_cursor = detail::next_cursor(j);
        return result;
    }
};

struct CallToolParams {
    std::string name;
    Json arguments = Json::object();

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"arguments", arguments}};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Resources
// ═══════════════════════════════════════════════════════════════════════════

struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    static Resource from_json(const Json& j) {
        Resource res;
        res.uri = detail::string_or_empty(j, "uri");
        res.name = detail::string_or_empty(j, "name");
        res.description = detail::optional_string(j, "description");
        res.mime_type = detail::optional_string(j, "mimeType");
        return res;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"uri", uri}, {"name", name}};
        if (description) j["description"] = *description;
        if (mime_type) j["mimeType"] = *mime_type;
        return j;
    }

    friend bool operator==(const Resource&, const Resource&) = default;
};

struct ListResourcesResult {
    std::vector<Resource> resources;
    std::optional<std::string> next_cursor;

    static ListResourcesResult from_json(const Json& j) {
        ListResourcesResult result;
        if (j.is_object() == false) {
            return result;
        }
        if (const auto it = j.find("resources"); it != j.end() && it->is_array()) {
            for (const auto& r : *it) {
                if (r.is_object()) {
                    result.resources.push_back(Resource::from_json(r));
                }
            }
        }
        result.next_cursor = detail::next_cursor(j);
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Prompts
// ═══════════════════════════════════════════════════════════════════════════

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;

    static PromptArgument from_json(const Json& j) {
        PromptArgument arg;
        arg.name = detail::string_or_empty(j, "name");
        arg.description = detail::optional_string(j, "description");
        if (const auto it = j.find("required"); it != j.end() && it->is_boolean()) {
            arg.required = it->get<bool>();
        }
        return arg;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) j["description"] = *description;
        if (required) j["required"] = required;
        return j;
    }

    friend bool operator==(const PromptArgument&, const PromptArgument&) = default;
};

struct Prompt {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;

    static Prompt from_json(const Json& j) {
        Prompt prompt;
        prompt.name = detail::string_or_empty(j, "name");
        prompt.description = detail::optional_string(j, "description");
        if (const auto it = j.find("arguments"); it != j.end() && it->is_array()) {
            for (const auto& a : *it) {
                if (a.is_object()) {
                    prompt.arguments.push_back(PromptArgument::from_json(a));
                }
            }
        }
        return prompt;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) j["description"] = *description;
        if (!arguments.empty()) {
            j["arguments"] = Json::array();
            for (const auto& arg : arguments) {
                j["arguments"].push_back(arg.to_json());
            }
        }
        return j;
    }

    friend bool operator==(const Prompt&, const Prompt&) = default;
};

struct ListPromptsResult {
    std::vector<Prompt> prompts;
    std::optional<std::string> next_cursor;

    static ListPromptsResult from_json(const Json& j) {
        ListPromptsResult result;
        if (j.is_object() == false) {
            return result;
        }
        if (const auto it = j.find("prompts"); it != j.end() && it->is_array()) {
            for (const auto& p : *it) {
                if (p.is_object()) {
                    result.prompts.push_back(Prompt::from_json(p));
                }
            }
        }
        result.next_cursor = detail::next_cursor(j);
        return result;
    }
};

}  // namespace mcphub

#endif  // MCPHUB_PROTOCOL_MCP_TYPES_HPP
