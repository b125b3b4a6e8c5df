#include "toolmux/tools/tool_use_state.hpp"
#include "toolmux/log/logger.hpp"

namespace toolmux {

namespace {

// Anything that is not a well-formed text block, including one whose "type"
// is not a string, is passed through as raw JSON.
ToolResultBlock to_block(const Json& item) {
    if (item.is_object() == false) {
        return ToolResultBlock{std::in_place_type<Json>, item};
    }
    auto type = item.find("type");
    auto text = item.find("text");
    if (type != item.end() && *type == "text" && text != item.end() && text->is_string()) {
        return ToolResultBlock{text->get<std::string>()};
    }
    return ToolResultBlock{std::in_place_type<Json>, item};
}

}  // namespace

ToolUseState::ToolUseState(ToolManager& manager, INativeToolExecutor& native, ToolPermissions& permissions)
    : manager_(manager)
    , native_(native)
    , permissions_(permissions)
{}

std::string ToolUseState::display_name(const ToolUse& use) {
    return ToolPermissions::permission_key(use.name, use.server_name);
}

ToolOutcome<void> ToolUseState::propose(std::vector<ToolUse> tool_uses) {
    if (phase_ != ToolUsePhase::AwaitingModelResponse && phase_ != ToolUsePhase::PromptUser) {
        return tl::unexpected(ToolError::invocation(
            "cannot propose tools while " + std::string(to_string(phase_))));
    }

    queue_.clear();
    results_.clear();
    pending_tool_index_ = 0;

    for (auto& use : tool_uses) {
        QueuedTool tool;
        tool.kind = use.is_native() ? ToolKind::Native : ToolKind::Mcp;
        tool.use = std::move(use);
        queue_.push_back(std::move(tool));
    }

    phase_ = queue_.empty() ? ToolUsePhase::PromptUser : ToolUsePhase::ToolsProposed;
    TOOLMUX_LOG_DEBUG(std::to_string(queue_.size()) + " tool use(s) proposed");
    return {};
}

asio::awaitable<ToolUsePhase> ToolUseState::async_advance() {
    if (phase_ != ToolUsePhase::ToolsProposed && phase_ != ToolUsePhase::ResultReady) {
        co_return phase_;
    }

    while (pending_tool_index_ < queue_.size()) {
        auto& tool = queue_[pending_tool_index_];
        auto label = display_name(tool.use);

        auto resolved = resolve(tool.use);
        if (!resolved) {
            TOOLMUX_LOG_DEBUG("tool " + label + " not resolved: " + resolved.error().message);
            finish(tool, ToolResult::error(tool.use.id, resolved.error().message));
            continue;
        }
        tool.trusted_by_default = *resolved;

        auto decision = permissions_.evaluate(tool.use.name, tool.use.server_name, tool.trusted_by_default);
        TOOLMUX_LOG_DEBUG("tool " + label + ": " + std::string(to_string(decision)));

        if (decision == PermissionDecision::Deny) {
            finish(tool, ToolResult::error(tool.use.id, PermissionError::blocked(label).message));
            continue;
        }
        if (decision == PermissionDecision::Ask) {
            tool.progress = ToolProgress::AwaitingConfirmation;
            phase_ = ToolUsePhase::PendingConfirmation;
            co_return phase_;
        }

        co_await async_invoke(tool);
    }

    phase_ = ToolUsePhase::PromptUser;
    co_return phase_;
}

asio::awaitable<ToolUsePhase> ToolUseState::async_confirm(Confirmation answer) {
    if (phase_ != ToolUsePhase::PendingConfirmation) {
        co_return phase_;
    }

    auto& tool = queue_[pending_tool_index_];
    switch (answer) {
        case Confirmation::Reject:
            finish(tool, ToolResult::error(tool.use.id, "tool use denied by user"));
            break;
        case Confirmation::Trust:
            permissions_.trust(ToolPermissions::permission_key(tool.use.name, tool.use.server_name));
            co_await async_invoke(tool);
            break;
        case Confirmation::Accept:
            co_await async_invoke(tool);
            break;
    }

    phase_ = ToolUsePhase::ResultReady;
    co_return co_await async_advance();
}

asio::awaitable<ToolOutcome<std::vector<ToolResult>>> ToolUseState::async_run_turn(
    std::vector<ToolUse> tool_uses,
    IConfirmationSource& confirmations
) {
    auto proposed = propose(std::move(tool_uses));
    if (!proposed) {
        co_return tl::unexpected(proposed.error());
    }

    auto phase = co_await async_advance();
    while (phase == ToolUsePhase::PendingConfirmation) {
        auto answer = co_await confirmations.async_confirm(*pending_tool());
        phase = co_await async_confirm(answer);
    }

    co_return take_results();
}

std::vector<ToolResult> ToolUseState::take_results() {
    auto results = std::move(results_);
    results_.clear();
    queue_.clear();
    pending_tool_index_ = 0;
    phase_ = ToolUsePhase::AwaitingModelResponse;
    return results;
}

const QueuedTool* ToolUseState::pending_tool() const noexcept {
    if (phase_ != ToolUsePhase::PendingConfirmation || pending_tool_index_ >= queue_.size()) {
        return nullptr;
    }
    return &queue_[pending_tool_index_];
}

// ─────────────────────────────────────────────────────────────────────────────
// Internals
// ─────────────────────────────────────────────────────────────────────────────

// Value is whether the tool is trusted by default
ToolOutcome<bool> ToolUseState::resolve(const ToolUse& use) const {
    if (use.is_native()) {
        if (native_.has_tool(use.name) == false) {
            return tl::unexpected(ToolError::unknown_tool("unknown tool '" + use.name + "'"));
        }
        return native_.trusted_by_default(use.name);
    }

    const auto& server = *use.server_name;
    auto state = manager_.state(server);
    if (!state) {
        return tl::unexpected(ToolError::unknown_tool("unknown server '" + server + "'"));
    }
    if (*state != ConnectionState::Ready) {
        return tl::unexpected(ToolError::invocation(
            "server '" + server + "' is " + std::string(to_string(*state))));
    }
    if (!manager_.find_tool(server, use.name)) {
        return tl::unexpected(ToolError::unknown_tool(
            "server '" + server + "' has no tool '" + use.name + "'"));
    }
    return false;
}

asio::awaitable<void> ToolUseState::async_invoke(QueuedTool& tool) {
    phase_ = ToolUsePhase::Invoking;
    tool.progress = ToolProgress::Invoking;
    const auto& use = tool.use;

    if (tool.kind == ToolKind::Native) {
        auto output = co_await native_.async_invoke(use);
        if (!output) {
            finish(tool, ToolResult::error(use.id, output.error().message));
        } else {
            finish(tool, ToolResult::success(use.id, std::move(*output)));
        }
        co_return;
    }

    auto called = co_await manager_.async_call_tool(*use.server_name, use.name, use.arguments);
    if (!called) {
        finish(tool, ToolResult::error(use.id, called.error().message));
        co_return;
    }

    std::vector<ToolResultBlock> blocks;
    for (const auto& item : called->content) {
        blocks.push_back(to_block(item));
    }
    ToolResult result{use.id, std::move(blocks), called->is_error ? ToolResultStatus::Error : ToolResultStatus::Success};
    finish(tool, std::move(result));
}

void ToolUseState::finish(QueuedTool& tool, ToolResult result) {
    TOOLMUX_LOG_DEBUG("tool " + display_name(tool.use) + " -> " + std::string(to_string(result.status)));
    tool.progress = ToolProgress::Done;
    results_.push_back(std::move(result));
    ++pending_tool_index_;
    phase_ = ToolUsePhase::ResultReady;
}

}  // namespace toolmux
