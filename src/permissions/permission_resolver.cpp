#include "toolmux/permissions/permission_resolver.hpp"

namespace toolmux {

bool matches_pattern(std::string_view pattern, std::string_view text) noexcept {
    // Iterative wildcard match with single backtrack point
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t star = std::string_view::npos;
    std::size_t star_text = 0;

    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            star_text = t;
        } else if (p < pattern.size() && pattern[p] == text[t]) {
            ++p;
            ++t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            t = ++star_text;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

bool matches_any_pattern(const ToolAllowlist& patterns, std::string_view text) noexcept {
    for (const auto& pattern : patterns) {
        if (matches_pattern(pattern, text)) {
            return true;
        }
    }
    return false;
}

std::string qualified_tool_name(std::string_view server_name, std::string_view tool_name) {
    std::string name;
    name.reserve(server_name.size() + tool_name.size() + 2);
    name.push_back(kMcpPatternPrefix);
    name.append(server_name);
    name.push_back(kServerToolDelimiter);
    name.append(tool_name);
    return name;
}

bool is_tool_in_allowlist(
    const ToolAllowlist& allowlist,
    std::string_view tool_name,
    std::optional<std::string_view> server_name
) {
    auto is_mcp_pattern = [](const std::string& p) { return p.empty() == false && p.front() == kMcpPatternPrefix; };

    if (!server_name) {
        for (const auto& pattern : allowlist) {
            if (is_mcp_pattern(pattern) == false && matches_pattern(pattern, tool_name)) {
                return true;
            }
        }
        return false;
    }

    std::string server_pattern = std::string(1, kMcpPatternPrefix) + std::string(*server_name);
    std::string tool_pattern = qualified_tool_name(*server_name, tool_name);

    for (const auto& pattern : allowlist) {
        if (is_mcp_pattern(pattern) == false) {
            continue;
        }
        if (matches_pattern(pattern, server_pattern) || matches_pattern(pattern, tool_pattern)) {
            return true;
        }
    }
    return false;
}

}  // namespace toolmux
