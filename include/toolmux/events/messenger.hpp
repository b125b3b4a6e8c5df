#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Messenger
// ═══════════════════════════════════════════════════════════════════════════
// Out-of-band events produced by server connections (listings fetched,
// lifecycle changes) and consumed by whoever renders them. Each connection
// owns its own messenger; every event carries the originating server name.

#include "toolmux/protocol/mcp_types.hpp"

#include <asio/awaitable.hpp>
#include <tl/expected.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace toolmux {

// ─────────────────────────────────────────────────────────────────────────────
// Events
// ─────────────────────────────────────────────────────────────────────────────

struct ListToolsResultEvent {
    std::string server_name;
    std::vector<ToolSpec> tools;
};

struct ListPromptsResultEvent {
    std::string server_name;
    std::vector<PromptSpec> prompts;
};

struct ListResourcesResultEvent {
    std::string server_name;
    std::vector<ResourceSpec> resources;
};

struct ResourceTemplatesListResultEvent {
    std::string server_name;
    std::vector<ResourceTemplateSpec> templates;
};

struct OauthLinkEvent {
    std::string server_name;
    std::string link;
};

struct InitStartEvent {
    std::string server_name;
};

struct DeinitEvent {
    std::string server_name;
};

using UpdateEventMessage = std::variant<
    ListToolsResultEvent,
    ListPromptsResultEvent,
    ListResourcesResultEvent,
    ResourceTemplatesListResultEvent,
    OauthLinkEvent,
    InitStartEvent,
    DeinitEvent
>;

[[nodiscard]] const std::string& server_name_of(const UpdateEventMessage& event) noexcept;

/// "list_tools", "init_start", ...
[[nodiscard]] std::string_view event_kind(const UpdateEventMessage& event) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────────────────────────────────────

struct MessengerError {
    enum class Kind {
        Closed,   ///< Receiver side is gone
        Aborted   ///< Wait for capacity was cancelled
    };

    Kind kind{Kind::Closed};
    std::string message;

    [[nodiscard]] static MessengerError closed(std::string_view server_name) {
        return {Kind::Closed, "event channel closed (from '" + std::string(server_name) + "')"};
    }

    [[nodiscard]] static MessengerError aborted(std::string msg) {
        return {Kind::Aborted, std::move(msg)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(MessengerError::Kind kind) noexcept {
    switch (kind) {
        case MessengerError::Kind::Closed:  return "Closed";
        case MessengerError::Kind::Aborted: return "Aborted";
    }
    return "Unknown";
}

using MessengerResult = tl::expected<void, MessengerError>;

// ─────────────────────────────────────────────────────────────────────────────
// IMessenger
// ─────────────────────────────────────────────────────────────────────────────

class IMessenger {
public:
    virtual ~IMessenger() = default;

    [[nodiscard]] virtual asio::awaitable<MessengerResult> async_send_tools_list_result(
        std::vector<ToolSpec> tools) = 0;

    [[nodiscard]] virtual asio::awaitable<MessengerResult> async_send_prompts_list_result(
        std::vector<PromptSpec> prompts) = 0;

    [[nodiscard]] virtual asio::awaitable<MessengerResult> async_send_resources_list_result(
        std::vector<ResourceSpec> resources) = 0;

    [[nodiscard]] virtual asio::awaitable<MessengerResult> async_send_resource_templates_list_result(
        std::vector<ResourceTemplateSpec> templates) = 0;

    [[nodiscard]] virtual asio::awaitable<MessengerResult> async_send_oauth_link(std::string link) = 0;

    [[nodiscard]] virtual asio::awaitable<MessengerResult> async_send_init_msg() = 0;

    /// Callable from non-coroutine code (shutdown, destructors). Delivery is
    /// best-effort and happens after this returns.
    virtual void send_deinit_msg() = 0;

    /// Independent handle publishing to the same destination under the same name
    [[nodiscard]] virtual std::unique_ptr<IMessenger> duplicate() const = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// NullMessenger - accepts and discards everything
// ─────────────────────────────────────────────────────────────────────────────

class NullMessenger final : public IMessenger {
public:
    asio::awaitable<MessengerResult> async_send_tools_list_result(std::vector<ToolSpec>) override {
        co_return MessengerResult{};
    }

    asio::awaitable<MessengerResult> async_send_prompts_list_result(std::vector<PromptSpec>) override {
        co_return MessengerResult{};
    }

    asio::awaitable<MessengerResult> async_send_resources_list_result(std::vector<ResourceSpec>) override {
        co_return MessengerResult{};
    }

    asio::awaitable<MessengerResult> async_send_resource_templates_list_result(
        std::vector<ResourceTemplateSpec>) override {
        co_return MessengerResult{};
    }

    asio::awaitable<MessengerResult> async_send_oauth_link(std::string) override {
        co_return MessengerResult{};
    }

    asio::awaitable<MessengerResult> async_send_init_msg() override {
        co_return MessengerResult{};
    }

    void send_deinit_msg() override {}

    [[nodiscard]] std::unique_ptr<IMessenger> duplicate() const override {
        return std::make_unique<NullMessenger>();
    }
};

}  // namespace toolmux
