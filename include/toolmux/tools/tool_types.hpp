#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Tool-use Types
// ═══════════════════════════════════════════════════════════════════════════
// What the model proposes (ToolUse), what goes back (ToolResult), and the
// errors that turn a proposal into an Error result instead of a call.

#include "toolmux/transport.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace toolmux {

struct ToolUse {
    std::string id;
    std::string name;
    std::optional<std::string> server_name;  ///< nullopt: native tool
    Json arguments = Json::object();

    [[nodiscard]] bool is_native() const noexcept { return !server_name.has_value(); }
};

// ─────────────────────────────────────────────────────────────────────────────
// ToolResult
// ─────────────────────────────────────────────────────────────────────────────

enum class ToolResultStatus : std::uint8_t {
    Success,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(ToolResultStatus status) noexcept {
    switch (status) {
        case ToolResultStatus::Success: return "success";
        case ToolResultStatus::Error:   return "error";
    }
    return "unknown";
}

/// Text, or structured content passed through as-is
using ToolResultBlock = std::variant<std::string, Json>;

struct ToolResult {
    std::string tool_use_id;
    std::vector<ToolResultBlock> content;
    ToolResultStatus status{ToolResultStatus::Success};

    [[nodiscard]] static ToolResult success(std::string tool_use_id, std::vector<ToolResultBlock> content) {
        return {std::move(tool_use_id), std::move(content), ToolResultStatus::Success};
    }

    [[nodiscard]] static ToolResult error(std::string tool_use_id, std::string message) {
        return {std::move(tool_use_id), {ToolResultBlock{std::move(message)}}, ToolResultStatus::Error};
    }

    [[nodiscard]] bool is_error() const noexcept { return status == ToolResultStatus::Error; }

    /// All blocks joined by newlines; JSON blocks are dumped
    [[nodiscard]] std::string text() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Queue entries
// ─────────────────────────────────────────────────────────────────────────────

enum class ToolKind : std::uint8_t {
    Native,
    Mcp
};

enum class ToolProgress : std::uint8_t {
    Queued,
    AwaitingConfirmation,
    Invoking,
    Done
};

[[nodiscard]] constexpr std::string_view to_string(ToolProgress progress) noexcept {
    switch (progress) {
        case ToolProgress::Queued:               return "queued";
        case ToolProgress::AwaitingConfirmation: return "awaiting confirmation";
        case ToolProgress::Invoking:             return "invoking";
        case ToolProgress::Done:                 return "done";
    }
    return "unknown";
}

struct QueuedTool {
    ToolUse use;
    ToolKind kind{ToolKind::Native};
    ToolProgress progress{ToolProgress::Queued};
    bool trusted_by_default{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────────────────────────────────────

struct ToolError {
    enum class Kind {
        Invocation,       ///< The call was made and failed
        UnknownTool,      ///< No such tool or server; nothing was called
        InvalidArguments  ///< Arguments rejected before the call
    };

    Kind kind{Kind::Invocation};
    std::string message;

    [[nodiscard]] static ToolError invocation(std::string msg) {
        return {Kind::Invocation, std::move(msg)};
    }

    [[nodiscard]] static ToolError unknown_tool(std::string msg) {
        return {Kind::UnknownTool, std::move(msg)};
    }

    [[nodiscard]] static ToolError invalid_arguments(std::string msg) {
        return {Kind::InvalidArguments, std::move(msg)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(ToolError::Kind kind) noexcept {
    switch (kind) {
        case ToolError::Kind::Invocation:       return "Invocation";
        case ToolError::Kind::UnknownTool:      return "UnknownTool";
        case ToolError::Kind::InvalidArguments: return "InvalidArguments";
    }
    return "Unknown";
}

template <typename T>
using ToolOutcome = tl::expected<T, ToolError>;

struct PermissionError {
    enum class Kind {
        Blocked
    };

    Kind kind{Kind::Blocked};
    std::string message;

    [[nodiscard]] static PermissionError blocked(std::string_view tool_label) {
        return {Kind::Blocked, "tool '" + std::string(tool_label) + "' is blocked"};
    }
};

[[nodiscard]] constexpr std::string_view to_string(PermissionError::Kind kind) noexcept {
    switch (kind) {
        case PermissionError::Kind::Blocked: return "Blocked";
    }
    return "Unknown";
}

}  // namespace toolmux
