#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// ServerMessenger - channel-backed IMessenger
// ═══════════════════════════════════════════════════════════════════════════
// All messengers built from one ServerMessengerBuilder publish into a single
// bounded asio channel; the one UpdateEventReceiver drains it. Producers
// suspend while the channel is full.
//
// USAGE:
//   auto [receiver, builder] = ServerMessengerBuilder::create(io.get_executor(), 64);
//   auto messenger = builder.build_with_name("git");
//   co_await messenger.async_send_init_msg();
//   auto event = co_await receiver.async_receive();

#include "toolmux/events/messenger.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/experimental/channel.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace toolmux {

using EventChannel = asio::experimental::channel<void(asio::error_code, UpdateEventMessage)>;

class ServerMessenger final : public IMessenger {
public:
    ServerMessenger(asio::any_io_executor executor, std::shared_ptr<EventChannel> channel, std::string server_name);

    asio::awaitable<MessengerResult> async_send_tools_list_result(std::vector<ToolSpec> tools) override;
    asio::awaitable<MessengerResult> async_send_prompts_list_result(std::vector<PromptSpec> prompts) override;
    asio::awaitable<MessengerResult> async_send_resources_list_result(std::vector<ResourceSpec> resources) override;
    asio::awaitable<MessengerResult> async_send_resource_templates_list_result(
        std::vector<ResourceTemplateSpec> templates) override;
    asio::awaitable<MessengerResult> async_send_oauth_link(std::string link) override;
    asio::awaitable<MessengerResult> async_send_init_msg() override;

    /// Spawns a detached coroutine that waits for capacity. If the channel
    /// closes first the event is dropped.
    void send_deinit_msg() override;

    [[nodiscard]] std::unique_ptr<IMessenger> duplicate() const override;

    [[nodiscard]] const std::string& server_name() const noexcept { return server_name_; }

private:
    asio::awaitable<MessengerResult> async_publish(UpdateEventMessage event);

    asio::any_io_executor executor_;
    std::shared_ptr<EventChannel> channel_;
    std::string server_name_;
};

// ─────────────────────────────────────────────────────────────────────────────
// UpdateEventReceiver - the single consumer end
// ─────────────────────────────────────────────────────────────────────────────

class UpdateEventReceiver {
public:
    explicit UpdateEventReceiver(std::shared_ptr<EventChannel> channel);

    UpdateEventReceiver(UpdateEventReceiver&&) noexcept = default;
    UpdateEventReceiver& operator=(UpdateEventReceiver&&) noexcept = default;
    UpdateEventReceiver(const UpdateEventReceiver&) = delete;
    UpdateEventReceiver& operator=(const UpdateEventReceiver&) = delete;

    /// Next event; std::nullopt once the channel is closed and drained
    [[nodiscard]] asio::awaitable<std::optional<UpdateEventMessage>> async_receive();

    /// Next buffered event, without waiting
    [[nodiscard]] std::optional<UpdateEventMessage> try_receive();

    /// Stop accepting events. Buffered events can still be received.
    void close();

    [[nodiscard]] bool is_open() const;

private:
    std::shared_ptr<EventChannel> channel_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ServerMessengerBuilder
// ─────────────────────────────────────────────────────────────────────────────

using MessengerFactory = std::function<std::unique_ptr<IMessenger>(const std::string& server_name)>;

class ServerMessengerBuilder {
public:
    [[nodiscard]] static std::pair<UpdateEventReceiver, ServerMessengerBuilder> create(
        asio::any_io_executor executor,
        std::size_t capacity
    );

    [[nodiscard]] ServerMessenger build_with_name(std::string server_name) const;

    /// For ToolManager: one messenger per connection
    [[nodiscard]] MessengerFactory factory() const;

private:
    ServerMessengerBuilder(asio::any_io_executor executor, std::shared_ptr<EventChannel> channel);

    asio::any_io_executor executor_;
    std::shared_ptr<EventChannel> channel_;
};

}  // namespace toolmux
