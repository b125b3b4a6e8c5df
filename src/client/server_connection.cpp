#include "toolmux/client/server_connection.hpp"
#include "toolmux/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>

namespace toolmux {

// ═══════════════════════════════════════════════════════════════════════════
// ConnectionLock
// ═══════════════════════════════════════════════════════════════════════════

ConnectionLock::Guard::~Guard() {
    if (channel_) {
        channel_->try_receive([](asio::error_code) {});
    }
}

ConnectionLock::ConnectionLock(asio::any_io_executor executor)
    : channel_(std::make_shared<Channel>(std::move(executor), 1))
{}

asio::awaitable<ConnectionLock::Guard> ConnectionLock::async_acquire() {
    co_await channel_->async_send(asio::error_code{}, asio::use_awaitable);
    co_return Guard(channel_);
}

bool ConnectionLock::is_locked() const {
    return channel_->ready();
}

// ═══════════════════════════════════════════════════════════════════════════
// ServerConnection
// ═══════════════════════════════════════════════════════════════════════════

ServerConnection::ServerConnection(
    asio::any_io_executor executor,
    ServerConfig config,
    std::unique_ptr<IMessenger> messenger
)
    : executor_(executor)
    , config_(std::move(config))
    , messenger_(messenger ? std::move(messenger) : std::make_unique<NullMessenger>())
    , lock_(std::move(executor))
{}

ServerConnection::~ServerConnection() {
    *alive_ = false;
    if (client_) {
        client_->interrupt_idle();
    }
}

asio::awaitable<ProtocolResult<void>> ServerConnection::async_start(
    std::unique_ptr<async::ITransport> transport,
    const Implementation& client_info,
    std::chrono::milliseconds init_timeout
) {
    state_ = ConnectionState::Initializing;
    last_error_.clear();
    TOOLMUX_LOG_DEBUG("initializing server '" + name() + "'");

    auto announced = co_await messenger_->async_send_init_msg();
    if (!announced) {
        TOOLMUX_LOG_DEBUG("init event for '" + name() + "' not delivered: " + announced.error().message);
    }

    if (!transport) {
        mark_failed("no transport");
        co_return tl::unexpected(ProtocolError::transport(TransportError::io("no transport for '" + name() + "'")));
    }

    auto started = co_await transport->async_start();
    if (!started) {
        mark_failed("failed to start: " + started.error().message);
        co_return tl::unexpected(ProtocolError::transport(started.error()));
    }

    client_ = std::make_unique<async::ProtocolClient>(
        std::move(transport),
        async::ProtocolClientConfig{config_.timeout, config_.timeout, init_timeout}
    );

    auto guard = co_await lock_.async_acquire();
    auto initialized = co_await client_->async_initialize(client_info);
    if (!initialized) {
        mark_failed("handshake failed: " + initialized.error().message);
        co_return tl::unexpected(initialized.error());
    }

    capabilities_ = initialized->capabilities;
    server_info_ = initialized->server_info;
    state_ = ConnectionState::Ready;

    TOOLMUX_LOG_INFO("server '" + name() + "' ready (" + initialized->server_info.name + " " +
                     initialized->server_info.version + ")");
    co_return ProtocolResult<void>{};
}

asio::awaitable<void> ServerConnection::async_fetch_catalog() {
    if (state_ != ConnectionState::Ready) {
        co_return;
    }

    auto tools = co_await async_list_all<ToolSpec>("tools/list", "tools");
    if (tools) {
        tools_ = *tools;
        auto sent = co_await messenger_->async_send_tools_list_result(std::move(*tools));
        if (!sent) {
            TOOLMUX_LOG_DEBUG("tools listing for '" + name() + "' not delivered: " + sent.error().message);
        }
    } else {
        TOOLMUX_LOG_WARN("tools/list on '" + name() + "' failed: " + tools.error().message);
    }

    if (capabilities_.prompts && state_ == ConnectionState::Ready) {
        co_await async_publish_prompts();
    }

    if (capabilities_.resources && state_ == ConnectionState::Ready) {
        auto resources = co_await async_list_all<ResourceSpec>("resources/list", "resources");
        if (resources) {
            auto sent = co_await messenger_->async_send_resources_list_result(std::move(*resources));
            if (!sent) {
                TOOLMUX_LOG_DEBUG("resources listing for '" + name() + "' not delivered");
            }
        } else {
            TOOLMUX_LOG_WARN("resources/list on '" + name() + "' failed: " + resources.error().message);
        }

        auto templates = co_await async_list_all<ResourceTemplateSpec>(
            "resources/templates/list", "resourceTemplates");
        if (templates) {
            auto sent = co_await messenger_->async_send_resource_templates_list_result(std::move(*templates));
            if (!sent) {
                TOOLMUX_LOG_DEBUG("resource templates for '" + name() + "' not delivered");
            }
        } else {
            TOOLMUX_LOG_WARN("resources/templates/list on '" + name() + "' failed: " + templates.error().message);
        }
    }
}

asio::awaitable<RegistryResult<JsonRpcResponse>> ServerConnection::async_request(
    std::string method,
    std::optional<Json> params
) {
    if (state_ != ConnectionState::Ready) {
        co_return tl::unexpected(RegistryError::unavailable(name(), to_string(state_)));
    }

    // Get the watcher off the lock before queueing for it
    ++waiting_;
    client_->interrupt_idle();
    auto guard = co_await lock_.async_acquire();
    --waiting_;

    // The previous holder may have taken us out of Ready
    if (state_ != ConnectionState::Ready) {
        co_return tl::unexpected(RegistryError::unavailable(name(), to_string(state_)));
    }

    auto response = co_await client_->async_request(std::move(method), std::move(params));
    if (!response) {
        on_protocol_failure(response.error());
        co_return tl::unexpected(RegistryError::protocol(response.error()));
    }
    co_return std::move(*response);
}

asio::awaitable<RegistryResult<std::vector<ToolSpec>>> ServerConnection::async_refresh_tools() {
    auto tools = co_await async_list_all<ToolSpec>("tools/list", "tools");
    if (!tools) {
        co_return tl::unexpected(tools.error());
    }

    tools_ = *tools;
    auto sent = co_await messenger_->async_send_tools_list_result(*tools);
    if (!sent) {
        TOOLMUX_LOG_DEBUG("tools listing for '" + name() + "' not delivered: " + sent.error().message);
    }
    co_return std::move(*tools);
}

void ServerConnection::shutdown() {
    if (state_ == ConnectionState::Deinitialized) {
        return;
    }
    if (client_) {
        client_->interrupt_idle();
        client_->transport().close();
    }
    mark_deinitialized("shut down");
}

void ServerConnection::start_watching() {
    if (state_ != ConnectionState::Ready) {
        return;
    }
    asio::co_spawn(executor_, async_watch(), asio::detached);
}

// ─────────────────────────────────────────────────────────────────────────────
// Internals
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<void> ServerConnection::async_publish_prompts() {
    auto prompts = co_await async_list_all<PromptSpec>("prompts/list", "prompts");
    if (!prompts) {
        TOOLMUX_LOG_WARN("prompts/list on '" + name() + "' failed: " + prompts.error().message);
        co_return;
    }
    auto sent = co_await messenger_->async_send_prompts_list_result(std::move(*prompts));
    if (!sent) {
        TOOLMUX_LOG_DEBUG("prompts listing for '" + name() + "' not delivered");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Idle watcher
// ─────────────────────────────────────────────────────────────────────────────
// `alive` and `lock` are copies so the loop can tell, after any suspension,
// whether the connection still exists; nothing else is touched until then.

asio::awaitable<void> ServerConnection::async_watch() {
    auto alive = alive_;
    auto lock = lock_;

    for (;;) {
        std::optional<TransportResult<JsonRpcMessage>> next;
        {
            auto guard = co_await lock.async_acquire();
            if (*alive == false || state_ != ConnectionState::Ready) {
                co_return;
            }
            if (waiting_ > 0) {
                continue;
            }

            next = co_await client_->async_listen_idle();
            if (*alive == false) {
                co_return;
            }
            if (!next) {
                continue;  // interrupted by a request
            }
            if (!*next) {
                on_protocol_failure(ProtocolError::transport(next->error()));
                continue;
            }
        }

        // Handled without the lock: a refresh takes it per request
        co_await async_handle_unsolicited(std::move(**next));
        if (*alive == false) {
            co_return;
        }
    }
}

asio::awaitable<void> ServerConnection::async_handle_unsolicited(JsonRpcMessage message) {
    if (auto* notification = std::get_if<JsonRpcNotification>(&message)) {
        const auto& method = notification->method();
        if (method == "notifications/tools/list_changed") {
            TOOLMUX_LOG_INFO("tools on '" + name() + "' changed");
            auto refreshed = co_await async_refresh_tools();
            if (!refreshed) {
                TOOLMUX_LOG_WARN("tools/list on '" + name() + "' failed: " + refreshed.error().message);
            }
        } else if (method == "notifications/prompts/list_changed") {
            TOOLMUX_LOG_INFO("prompts on '" + name() + "' changed");
            co_await async_publish_prompts();
        } else {
            TOOLMUX_LOG_DEBUG("ignoring '" + method + "' from '" + name() + "'");
        }
        co_return;
    }

    if (auto* response = std::get_if<JsonRpcResponse>(&message)) {
        if (response->id().has_value() && client_->forget_abandoned(*response->id())) {
            TOOLMUX_LOG_DEBUG("discarding late response " + response->id()->to_string() + " from '" + name() + "'");
        } else {
            TOOLMUX_LOG_WARN("unexpected response from '" + name() + "' while idle");
        }
        co_return;
    }

    TOOLMUX_LOG_WARN("'" + name() + "' sent request '" + std::get<JsonRpcRequest>(message).method() +
                     "'; server requests are not supported");
}

template <typename T>
asio::awaitable<RegistryResult<std::vector<T>>> ServerConnection::async_list_all(
    const std::string& method,
    const char* key
) {
    std::vector<T> items;
    std::optional<std::string> cursor;

    do {
        std::optional<Json> params;
        if (cursor) {
            params = Json{{"cursor", *cursor}};
        }

        auto response = co_await async_request(method, std::move(params));
        if (!response) {
            co_return tl::unexpected(response.error());
        }

        const Json& result = response->result();
        try {
            auto page = parse_listing<T>(result, key);
            items.insert(items.end(), std::make_move_iterator(page.begin()), std::make_move_iterator(page.end()));
        } catch (const Json::exception& e) {
            co_return tl::unexpected(RegistryError::protocol(
                ProtocolError::unexpected_message("malformed " + method + " result: " + e.what())));
        }

        cursor.reset();
        if (result.is_object() && result.contains("nextCursor") && result["nextCursor"].is_string()) {
            cursor = result["nextCursor"].get<std::string>();
        }
    } while (cursor);

    co_return items;
}

void ServerConnection::on_protocol_failure(const ProtocolError& error) {
    TOOLMUX_LOG_DEBUG("request on '" + name() + "' failed (" + std::string(to_string(error.kind)) +
                      "): " + error.message);

    if (state_ != ConnectionState::Ready) {
        return;
    }
    if (error.kind != ProtocolError::Kind::Transport || !error.cause ||
        error.cause->kind != TransportError::Kind::Io) {
        return;  // timeouts and bad replies leave the process usable
    }

    if (client_->transport().peer_exited()) {
        mark_deinitialized("server exited: " + error.message);
    } else {
        mark_failed("I/O error: " + error.message);
    }
}

void ServerConnection::mark_failed(std::string reason) {
    TOOLMUX_LOG_WARN("server '" + name() + "' failed: " + reason);
    state_ = ConnectionState::Failed;
    last_error_ = std::move(reason);
    if (client_) {
        client_->transport().close();
    }
}

void ServerConnection::mark_deinitialized(std::string reason) {
    TOOLMUX_LOG_INFO("server '" + name() + "' deinitialized: " + reason);
    state_ = ConnectionState::Deinitialized;
    last_error_ = std::move(reason);
    messenger_->send_deinit_msg();
}

}  // namespace toolmux
