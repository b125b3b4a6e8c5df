#include "toolmux/client/tool_manager.hpp"
#include "toolmux/async/stdio_transport.hpp"
#include "toolmux/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/use_awaitable.hpp>

namespace toolmux {

TransportFactory default_transport_factory() {
    return [](asio::any_io_executor executor, const ServerConfig& server) -> std::unique_ptr<async::ITransport> {
        async::StdioTransportConfig config;
        config.command = server.command;
        config.args = server.args;
        config.env = server.env;
        return async::make_stdio_transport(std::move(executor), std::move(config));
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

ToolManager::ToolManager(
    asio::any_io_executor executor,
    ToolManagerConfig config,
    MessengerFactory messengers,
    TransportFactory transports
)
    : executor_(std::move(executor))
    , config_(std::move(config))
    , transports_(transports ? std::move(transports) : default_transport_factory())
{
    for (const auto& server : config_.servers) {
        if (connections_.count(server.name) != 0) {
            TOOLMUX_LOG_WARN("duplicate server name '" + server.name + "', keeping the first");
            continue;
        }
        std::unique_ptr<IMessenger> messenger = messengers
            ? messengers(server.name)
            : std::make_unique<NullMessenger>();
        connections_.emplace(
            server.name,
            std::make_unique<ServerConnection>(executor_, server, std::move(messenger))
        );
    }
}

ToolManager::~ToolManager() = default;

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> ToolManager::async_init() {
    if (connections_.empty()) {
        co_return;
    }

    // Each connection signals here when it has settled
    using Done = asio::experimental::channel<void(asio::error_code)>;
    auto done = std::make_shared<Done>(executor_, connections_.size());

    for (auto& [name, connection] : connections_) {
        asio::co_spawn(
            executor_,
            [this, conn = connection.get(), done]() -> asio::awaitable<void> {
                co_await async_init_one(*conn);
                done->try_send(asio::error_code{});
            },
            asio::detached
        );
    }

    for (std::size_t i = 0; i < connections_.size(); ++i) {
        co_await done->async_receive(asio::use_awaitable);
    }

    std::size_t ready = 0;
    for (const auto& [name, connection] : connections_) {
        if (connection->state() == ConnectionState::Ready) {
            ++ready;
        }
    }
    TOOLMUX_LOG_INFO(std::to_string(ready) + "/" + std::to_string(connections_.size()) + " servers ready");
}

asio::awaitable<void> ToolManager::async_init_one(ServerConnection& connection) {
    auto started = co_await connection.async_start(
        transports_(executor_, connection.config()),
        config_.client_info,
        config_.init_timeout
    );
    if (!started) {
        co_return;  // already logged and marked Failed
    }

    co_await connection.async_fetch_catalog();
    connection.start_watching();
}

void ToolManager::shutdown() {
    for (auto& [name, connection] : connections_) {
        connection->shutdown();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Requests
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<RegistryResult<JsonRpcResponse>> ToolManager::async_request(
    std::string_view server_name,
    std::string method,
    std::optional<Json> params
) {
    auto* connection = find(server_name);
    if (connection == nullptr) {
        co_return tl::unexpected(RegistryError::unknown_server(server_name));
    }
    co_return co_await connection->async_request(std::move(method), std::move(params));
}

asio::awaitable<RegistryResult<CallToolResult>> ToolManager::async_call_tool(
    std::string_view server_name,
    std::string tool_name,
    Json arguments
) {
    auto* connection = find(server_name);
    if (connection == nullptr) {
        co_return tl::unexpected(RegistryError::unknown_server(server_name));
    }

    TOOLMUX_LOG_DEBUG("calling " + std::string(server_name) + "/" + tool_name);
    auto response = co_await connection->async_request(
        "tools/call",
        Json{{"name", tool_name}, {"arguments", std::move(arguments)}}
    );
    if (!response) {
        co_return tl::unexpected(response.error());
    }

    try {
        co_return CallToolResult::from_json(response->result());
    } catch (const Json::exception& e) {
        co_return tl::unexpected(RegistryError::protocol(
            ProtocolError::unexpected_message("malformed tools/call result: " + std::string(e.what()))));
    }
}

asio::awaitable<RegistryResult<std::vector<ToolSpec>>> ToolManager::async_refresh_tools(
    std::string_view server_name
) {
    auto* connection = find(server_name);
    if (connection == nullptr) {
        co_return tl::unexpected(RegistryError::unknown_server(server_name));
    }
    co_return co_await connection->async_refresh_tools();
}

// ═══════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════

std::vector<std::string> ToolManager::server_names() const {
    std::vector<std::string> names;
    names.reserve(connections_.size());
    for (const auto& [name, connection] : connections_) {
        names.push_back(name);
    }
    return names;
}

bool ToolManager::contains(std::string_view server_name) const {
    return find(server_name) != nullptr;
}

std::optional<ConnectionState> ToolManager::state(std::string_view server_name) const {
    auto* connection = find(server_name);
    if (connection == nullptr) {
        return std::nullopt;
    }
    return connection->state();
}

std::vector<ToolSpec> ToolManager::tools(std::string_view server_name) const {
    auto* connection = find(server_name);
    if (connection == nullptr) {
        return {};
    }
    return connection->tools();
}

std::optional<ToolSpec> ToolManager::find_tool(std::string_view server_name, std::string_view tool_name) const {
    auto* connection = find(server_name);
    if (connection == nullptr) {
        return std::nullopt;
    }
    for (const auto& tool : connection->tools()) {
        if (tool.name == tool_name) {
            return tool;
        }
    }
    return std::nullopt;
}

std::string ToolManager::last_error(std::string_view server_name) const {
    auto* connection = find(server_name);
    return connection ? connection->last_error() : std::string{};
}

ServerConnection* ToolManager::find(std::string_view server_name) const {
    auto it = connections_.find(server_name);
    return it == connections_.end() ? nullptr : it->second.get();
}

}  // namespace toolmux
