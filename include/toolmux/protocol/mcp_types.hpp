#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// MCP Payload Types
// ═══════════════════════════════════════════════════════════════════════════
// The subset of MCP result payloads toolmux reads from tool servers:
// the initialize handshake, catalog listings and tools/call results.

#include "toolmux/transport.hpp"

#include <optional>
#include <string>
#include <vector>

namespace toolmux {

inline constexpr const char* kMcpProtocolVersion = "2024-11-05";

// ─────────────────────────────────────────────────────────────────────────────
// Initialize
// ─────────────────────────────────────────────────────────────────────────────

struct Implementation {
    std::string name;
    std::string version;

    static Implementation from_json(const Json& j) {
        return Implementation{j.value("name", ""), j.value("version", "")};
    }

    [[nodiscard]] Json to_json() const {
        return Json{{"name", name}, {"version", version}};
    }
};

struct ServerCapabilities {
    bool tools{false};
    bool prompts{false};
    bool resources{false};

    static ServerCapabilities from_json(const Json& j) {
        ServerCapabilities caps;
        if (j.is_object() == false) {
            return caps;
        }
        caps.tools = j.contains("tools");
        caps.prompts = j.contains("prompts");
        caps.resources = j.contains("resources");
        return caps;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    static InitializeResult from_json(const Json& j) {
        InitializeResult result;
        result.protocol_version = j.value("protocolVersion", "");
        if (j.contains("capabilities")) {
            result.capabilities = ServerCapabilities::from_json(j["capabilities"]);
        }
        if (j.contains("serverInfo")) {
            result.server_info = Implementation::from_json(j["serverInfo"]);
        }
        if (j.contains("instructions") && j["instructions"].is_string()) {
            result.instructions = j["instructions"].get<std::string>();
        }
        return result;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Catalog entries
// ─────────────────────────────────────────────────────────────────────────────

struct ToolSpec {
    std::string name;
    std::string description;
    Json input_schema = Json::object();

    static ToolSpec from_json(const Json& j) {
        ToolSpec spec;
        spec.name = j.value("name", "");
        spec.description = j.value("description", "");
        if (j.contains("inputSchema")) {
            spec.input_schema = j["inputSchema"];
        }
        return spec;
    }

    [[nodiscard]] Json to_json() const {
        return Json{
            {"name", name},
            {"description", description},
            {"inputSchema", input_schema}};
    }
};

struct PromptSpec {
    std::string name;
    std::optional<std::string> description;
    Json arguments = Json::array();

    static PromptSpec from_json(const Json& j) {
        PromptSpec spec;
        spec.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            spec.description = j["description"].get<std::string>();
        }
        if (j.contains("arguments")) {
            spec.arguments = j["arguments"];
        }
        return spec;
    }
};

struct ResourceSpec {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    static ResourceSpec from_json(const Json& j) {
        ResourceSpec spec;
        spec.uri = j.value("uri", "");
        spec.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            spec.description = j["description"].get<std::string>();
        }
        if (j.contains("mimeType") && j["mimeType"].is_string()) {
            spec.mime_type = j["mimeType"].get<std::string>();
        }
        return spec;
    }
};

struct ResourceTemplateSpec {
    std::string uri_template;
    std::string name;
    std::optional<std::string> description;

    static ResourceTemplateSpec from_json(const Json& j) {
        ResourceTemplateSpec spec;
        spec.uri_template = j.value("uriTemplate", "");
        spec.name = j.value("name", "");
        if (j.contains("description") && j["description"].is_string()) {
            spec.description = j["description"].get<std::string>();
        }
        return spec;
    }
};

/// Read `result[key]` as an array of T, skipping a missing or malformed list
template <typename T>
[[nodiscard]] std::vector<T> parse_listing(const Json& result, const char* key) {
    std::vector<T> items;
    if (result.is_object() == false || result.contains(key) == false) {
        return items;
    }
    const Json& list = result.at(key);
    if (list.is_array() == false) {
        return items;
    }
    items.reserve(list.size());
    for (const auto& entry : list) {
        if (entry.is_object()) {
            items.push_back(T::from_json(entry));
        }
    }
    return items;
}

// ─────────────────────────────────────────────────────────────────────────────
// tools/call
// ─────────────────────────────────────────────────────────────────────────────

struct CallToolResult {
    Json content = Json::array();
    bool is_error{false};

    static CallToolResult from_json(const Json& j) {
        CallToolResult result;
        if (j.contains("content") && j["content"].is_array()) {
            result.content = j["content"];
        }
        result.is_error = j.value("isError", false);
        return result;
    }
};

}  // namespace toolmux
