#include "toolmux/events/server_messenger.hpp"
#include "toolmux/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>

namespace toolmux {

// ═══════════════════════════════════════════════════════════════════════════
// ServerMessenger
// ═══════════════════════════════════════════════════════════════════════════

ServerMessenger::ServerMessenger(
    asio::any_io_executor executor,
    std::shared_ptr<EventChannel> channel,
    std::string server_name
)
    : executor_(std::move(executor))
    , channel_(std::move(channel))
    , server_name_(std::move(server_name))
{}

asio::awaitable<MessengerResult> ServerMessenger::async_send_tools_list_result(std::vector<ToolSpec> tools) {
    co_return co_await async_publish(ListToolsResultEvent{server_name_, std::move(tools)});
}

asio::awaitable<MessengerResult> ServerMessenger::async_send_prompts_list_result(std::vector<PromptSpec> prompts) {
    co_return co_await async_publish(ListPromptsResultEvent{server_name_, std::move(prompts)});
}

asio::awaitable<MessengerResult> ServerMessenger::async_send_resources_list_result(
    std::vector<ResourceSpec> resources
) {
    co_return co_await async_publish(ListResourcesResultEvent{server_name_, std::move(resources)});
}

asio::awaitable<MessengerResult> ServerMessenger::async_send_resource_templates_list_result(
    std::vector<ResourceTemplateSpec> templates
) {
    co_return co_await async_publish(ResourceTemplatesListResultEvent{server_name_, std::move(templates)});
}

asio::awaitable<MessengerResult> ServerMessenger::async_send_oauth_link(std::string link) {
    co_return co_await async_publish(OauthLinkEvent{server_name_, std::move(link)});
}

asio::awaitable<MessengerResult> ServerMessenger::async_send_init_msg() {
    co_return co_await async_publish(InitStartEvent{server_name_});
}

void ServerMessenger::send_deinit_msg() {
    // Detached: the caller may be a destructor or other non-coroutine code
    asio::co_spawn(
        executor_,
        [channel = channel_, name = server_name_]() -> asio::awaitable<void> {
            try {
                co_await channel->async_send(asio::error_code{}, UpdateEventMessage{DeinitEvent{name}},
                                             asio::use_awaitable);
            } catch (const std::system_error& e) {
                TOOLMUX_LOG_DEBUG("deinit event for '" + name + "' dropped: " + e.what());
            }
        },
        asio::detached
    );
}

std::unique_ptr<IMessenger> ServerMessenger::duplicate() const {
    return std::make_unique<ServerMessenger>(executor_, channel_, server_name_);
}

asio::awaitable<MessengerResult> ServerMessenger::async_publish(UpdateEventMessage event) {
    if (channel_->is_open() == false) {
        co_return tl::unexpected(MessengerError::closed(server_name_));
    }

    try {
        co_await channel_->async_send(asio::error_code{}, std::move(event), asio::use_awaitable);
    } catch (const std::system_error& e) {
        if (channel_->is_open() == false) {
            co_return tl::unexpected(MessengerError::closed(server_name_));
        }
        co_return tl::unexpected(MessengerError::aborted(e.what()));
    }

    co_return MessengerResult{};
}

// ═══════════════════════════════════════════════════════════════════════════
// UpdateEventReceiver
// ═══════════════════════════════════════════════════════════════════════════

UpdateEventReceiver::UpdateEventReceiver(std::shared_ptr<EventChannel> channel)
    : channel_(std::move(channel))
{}

asio::awaitable<std::optional<UpdateEventMessage>> UpdateEventReceiver::async_receive() {
    try {
        auto event = co_await channel_->async_receive(asio::use_awaitable);
        co_return std::optional<UpdateEventMessage>(std::move(event));
    } catch (const std::system_error&) {
        // channel_closed once drained, or cancelled
        co_return std::nullopt;
    }
}

std::optional<UpdateEventMessage> UpdateEventReceiver::try_receive() {
    std::optional<UpdateEventMessage> event;
    channel_->try_receive([&event](asio::error_code ec, UpdateEventMessage message) {
        if (!ec) {
            event = std::move(message);
        }
    });
    return event;
}

void UpdateEventReceiver::close() {
    channel_->close();
}

bool UpdateEventReceiver::is_open() const {
    return channel_->is_open();
}

// ═══════════════════════════════════════════════════════════════════════════
// ServerMessengerBuilder
// ═══════════════════════════════════════════════════════════════════════════

ServerMessengerBuilder::ServerMessengerBuilder(asio::any_io_executor executor, std::shared_ptr<EventChannel> channel)
    : executor_(std::move(executor))
    , channel_(std::move(channel))
{}

std::pair<UpdateEventReceiver, ServerMessengerBuilder> ServerMessengerBuilder::create(
    asio::any_io_executor executor,
    std::size_t capacity
) {
    auto channel = std::make_shared<EventChannel>(executor, capacity);
    return {UpdateEventReceiver(channel), ServerMessengerBuilder(std::move(executor), channel)};
}

ServerMessenger ServerMessengerBuilder::build_with_name(std::string server_name) const {
    return ServerMessenger(executor_, channel_, std::move(server_name));
}

MessengerFactory ServerMessengerBuilder::factory() const {
    return [executor = executor_, channel = channel_](const std::string& server_name) -> std::unique_ptr<IMessenger> {
        return std::make_unique<ServerMessenger>(executor, channel, server_name);
    };
}

}  // namespace toolmux
