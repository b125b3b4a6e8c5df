#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// ToolManager - registry of tool-server connections
// ═══════════════════════════════════════════════════════════════════════════
// Owns every configured ServerConnection, brings them up concurrently and
// routes requests by server name. One request is in flight per connection;
// different connections proceed independently.
//
// The manager must outlive every coroutine it hands out.

#include "toolmux/async/async_transport.hpp"
#include "toolmux/client/server_connection.hpp"
#include "toolmux/events/server_messenger.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolmux {

/// Produces the (unstarted) transport for one server
using TransportFactory = std::function<
    std::unique_ptr<async::ITransport>(asio::any_io_executor, const ServerConfig&)
>;

/// Child process over stdio, stderr inherited
[[nodiscard]] TransportFactory default_transport_factory();

struct ToolManagerConfig {
    std::vector<ServerConfig> servers;
    Implementation client_info{"toolmux", "0.1.0"};
    std::chrono::milliseconds init_timeout{120'000};
};

class ToolManager {
public:
    /// `messengers` builds one messenger per server (NullMessenger if empty);
    /// `transports` defaults to default_transport_factory().
    ToolManager(
        asio::any_io_executor executor,
        ToolManagerConfig config,
        MessengerFactory messengers = {},
        TransportFactory transports = {}
    );

    ~ToolManager();

    ToolManager(const ToolManager&) = delete;
    ToolManager& operator=(const ToolManager&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Start every connection concurrently and fetch catalogs. Completes
    /// when all have settled; individual failures leave that connection Failed.
    asio::awaitable<void> async_init();

    /// Close every child's stdin and mark all connections Deinitialized
    void shutdown();

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::awaitable<RegistryResult<JsonRpcResponse>> async_request(
        std::string_view server_name,
        std::string method,
        std::optional<Json> params = std::nullopt
    );

    /// `tools/call`; a result with isError set is still a successful call
    [[nodiscard]] asio::awaitable<RegistryResult<CallToolResult>> async_call_tool(
        std::string_view server_name,
        std::string tool_name,
        Json arguments
    );

    [[nodiscard]] asio::awaitable<RegistryResult<std::vector<ToolSpec>>> async_refresh_tools(
        std::string_view server_name
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<std::string> server_names() const;
    [[nodiscard]] bool contains(std::string_view server_name) const;
    [[nodiscard]] std::optional<ConnectionState> state(std::string_view server_name) const;
    [[nodiscard]] std::vector<ToolSpec> tools(std::string_view server_name) const;
    [[nodiscard]] std::optional<ToolSpec> find_tool(std::string_view server_name, std::string_view tool_name) const;
    [[nodiscard]] std::string last_error(std::string_view server_name) const;

private:
    [[nodiscard]] ServerConnection* find(std::string_view server_name) const;
    asio::awaitable<void> async_init_one(ServerConnection& connection);

    asio::any_io_executor executor_;
    ToolManagerConfig config_;
    TransportFactory transports_;
    std::map<std::string, std::unique_ptr<ServerConnection>, std::less<>> connections_;
};

}  // namespace toolmux
