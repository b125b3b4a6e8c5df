#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Permission Resolver
// ─────────────────────────────────────────────────────────────────────────────
// Decides whether a tool is pre-approved by a flat allowlist of patterns.
//
//   fs_*            native tools only (no leading '@')
//   @git            every tool on server "git"
//   @git/read_*     matching tools on server "git"
//
// Patterns are anchored globs: '*' matches any run of characters (including
// none), everything else matches itself.

#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace toolmux {

inline constexpr char kServerToolDelimiter = '/';
inline constexpr char kMcpPatternPrefix = '@';

using ToolAllowlist = std::set<std::string, std::less<>>;

[[nodiscard]] bool matches_pattern(std::string_view pattern, std::string_view text) noexcept;

[[nodiscard]] bool matches_any_pattern(const ToolAllowlist& patterns, std::string_view text) noexcept;

/// `server_name` empty/absent means a native tool
[[nodiscard]] bool is_tool_in_allowlist(
    const ToolAllowlist& allowlist,
    std::string_view tool_name,
    std::optional<std::string_view> server_name
);

/// "@server/tool", the form MCP patterns are matched against
[[nodiscard]] std::string qualified_tool_name(std::string_view server_name, std::string_view tool_name);

}  // namespace toolmux
