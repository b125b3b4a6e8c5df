#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Tool-use Execution State Machine
// ═══════════════════════════════════════════════════════════════════════════
// Drives the tool uses of one model turn to results, one tool at a time:
//
//   AwaitingModelResponse --propose--> ToolsProposed --advance-->
//       PendingConfirmation --confirm--> Invoking --> ResultReady --> ...
//       ... --> PromptUser --take_results--> AwaitingModelResponse
//
// The state is a plain value on the ChatSession so an interactive front
// end can return to its input loop while a confirmation is pending.

#include "toolmux/client/tool_manager.hpp"
#include "toolmux/permissions/tool_permissions.hpp"
#include "toolmux/tools/native_tools.hpp"
#include "toolmux/tools/tool_types.hpp"

#include <asio/awaitable.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace toolmux {

enum class ToolUsePhase : std::uint8_t {
    AwaitingModelResponse,
    ToolsProposed,
    PendingConfirmation,
    Invoking,
    ResultReady,
    PromptUser
};

[[nodiscard]] constexpr std::string_view to_string(ToolUsePhase phase) noexcept {
    switch (phase) {
        case ToolUsePhase::AwaitingModelResponse: return "AwaitingModelResponse";
        case ToolUsePhase::ToolsProposed:         return "ToolsProposed";
        case ToolUsePhase::PendingConfirmation:   return "PendingConfirmation";
        case ToolUsePhase::Invoking:              return "Invoking";
        case ToolUsePhase::ResultReady:           return "ResultReady";
        case ToolUsePhase::PromptUser:            return "PromptUser";
    }
    return "Unknown";
}

enum class Confirmation : std::uint8_t {
    Accept,  // Run this once
    Reject,  // Do not run; report a denial
    Trust    // Run, and trust this tool for the rest of the session
};

/// Where confirmations come from when a whole turn is driven in one call
class IConfirmationSource {
public:
    virtual ~IConfirmationSource() = default;

    [[nodiscard]] virtual asio::awaitable<Confirmation> async_confirm(const QueuedTool& tool) = 0;
};

class ToolUseState {
public:
    ToolUseState(ToolManager& manager, INativeToolExecutor& native, ToolPermissions& permissions);

    /// Queue the tool uses of a model turn. Only valid between turns.
    ToolOutcome<void> propose(std::vector<ToolUse> tool_uses);

    /// Process from the cursor until a confirmation is needed or every tool
    /// has a result. Returns the phase it stopped in.
    asio::awaitable<ToolUsePhase> async_advance();

    /// Answer the pending confirmation, then keep advancing
    asio::awaitable<ToolUsePhase> async_confirm(Confirmation answer);

    /// propose + advance + confirm loop; returns the results
    asio::awaitable<ToolOutcome<std::vector<ToolResult>>> async_run_turn(
        std::vector<ToolUse> tool_uses,
        IConfirmationSource& confirmations
    );

    /// Results in proposal order; back to AwaitingModelResponse
    [[nodiscard]] std::vector<ToolResult> take_results();

    [[nodiscard]] ToolUsePhase phase() const noexcept { return phase_; }
    [[nodiscard]] std::size_t pending_tool_index() const noexcept { return pending_tool_index_; }
    [[nodiscard]] const std::vector<QueuedTool>& queue() const noexcept { return queue_; }
    [[nodiscard]] const std::vector<ToolResult>& results() const noexcept { return results_; }

    /// The tool awaiting confirmation, or nullptr
    [[nodiscard]] const QueuedTool* pending_tool() const noexcept;

    /// "fs_read" or "@server/tool"
    [[nodiscard]] static std::string display_name(const ToolUse& use);

private:
    [[nodiscard]] ToolOutcome<bool> resolve(const ToolUse& use) const;
    asio::awaitable<void> async_invoke(QueuedTool& tool);
    void finish(QueuedTool& tool, ToolResult result);

    ToolManager& manager_;
    INativeToolExecutor& native_;
    ToolPermissions& permissions_;

    ToolUsePhase phase_{ToolUsePhase::AwaitingModelResponse};
    std::vector<QueuedTool> queue_;
    std::size_t pending_tool_index_{0};
    std::vector<ToolResult> results_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ChatSession - per-conversation state the front end keeps between inputs
// ─────────────────────────────────────────────────────────────────────────────

class ChatSession {
public:
    ChatSession(ToolManager& manager, INativeToolExecutor& native, ToolPermissions permissions = {})
        : permissions_(std::move(permissions))
        , tool_use_(manager, native, permissions_)
    {}

    ChatSession(const ChatSession&) = delete;
    ChatSession& operator=(const ChatSession&) = delete;

    [[nodiscard]] ToolPermissions& permissions() noexcept { return permissions_; }
    [[nodiscard]] ToolUseState& tool_use() noexcept { return tool_use_; }

private:
    ToolPermissions permissions_;
    ToolUseState tool_use_;
};

}  // namespace toolmux
