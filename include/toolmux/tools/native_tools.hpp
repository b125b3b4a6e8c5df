#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Native Tools - tools implemented in-process
// ─────────────────────────────────────────────────────────────────────────────

#include "toolmux/protocol/mcp_types.hpp"
#include "toolmux/tools/tool_types.hpp"

#include <asio/awaitable.hpp>

#include <string_view>
#include <vector>

namespace toolmux {

class INativeToolExecutor {
public:
    virtual ~INativeToolExecutor() = default;

    [[nodiscard]] virtual bool has_tool(std::string_view name) const = 0;
    [[nodiscard]] virtual std::vector<ToolSpec> specs() const = 0;

    /// Whether the tool runs without confirmation when no override applies
    [[nodiscard]] virtual bool trusted_by_default(std::string_view name) const = 0;

    [[nodiscard]] virtual asio::awaitable<ToolOutcome<std::vector<ToolResultBlock>>> async_invoke(
        const ToolUse& use) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// BuiltinToolExecutor
// ─────────────────────────────────────────────────────────────────────────────
//   fs_read  {path, start_line?, end_line?}   trusted
//   fs_write {path, content}                  asks
//
// Line numbers are 1-based and inclusive; negative values count from the end
// (-1 is the last line).

class BuiltinToolExecutor final : public INativeToolExecutor {
public:
    static constexpr std::string_view kFsRead = "fs_read";
    static constexpr std::string_view kFsWrite = "fs_write";

    [[nodiscard]] bool has_tool(std::string_view name) const override;
    [[nodiscard]] std::vector<ToolSpec> specs() const override;
    [[nodiscard]] bool trusted_by_default(std::string_view name) const override;

    [[nodiscard]] asio::awaitable<ToolOutcome<std::vector<ToolResultBlock>>> async_invoke(
        const ToolUse& use) override;

private:
    [[nodiscard]] static ToolOutcome<std::vector<ToolResultBlock>> fs_read(const Json& args);
    [[nodiscard]] static ToolOutcome<std::vector<ToolResultBlock>> fs_write(const Json& args);
};

}  // namespace toolmux
