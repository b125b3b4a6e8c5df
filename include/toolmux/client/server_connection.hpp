#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Connection
// ═══════════════════════════════════════════════════════════════════════════
// One configured tool server: its process (through the transport), the
// protocol client on top, the cached catalog and its lifecycle state.
// Owned exclusively by ToolManager.
//
//   Uninitialized -> Initializing -> Ready
//                                 \-> Failed
//   Ready -> Failed          (I/O error, process still running)
//   Ready -> Deinitialized   (process exited, or shutdown())
//
// While Ready and between requests, a watcher coroutine holds the lock and
// listens for list_changed notifications. A request interrupts it and goes
// first.

#include "toolmux/async/protocol_client.hpp"
#include "toolmux/client/client_error.hpp"
#include "toolmux/events/messenger.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/channel.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolmux {

struct ServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    /// Per-request deadline for send and for listen
    std::chrono::milliseconds timeout{120'000};
};

enum class ConnectionState {
    Uninitialized,
    Initializing,
    Ready,
    Failed,
    Deinitialized
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Uninitialized: return "uninitialized";
        case ConnectionState::Initializing:  return "initializing";
        case ConnectionState::Ready:         return "ready";
        case ConnectionState::Failed:        return "failed";
        case ConnectionState::Deinitialized: return "deinitialized";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// ConnectionLock - one round trip at a time per connection
// ─────────────────────────────────────────────────────────────────────────────
// A one-slot channel: acquiring fills the slot (suspending while it is
// full), the guard empties it on destruction.

class ConnectionLock {
public:
    using Channel = asio::experimental::channel<void(asio::error_code)>;

    class Guard {
    public:
        explicit Guard(std::shared_ptr<Channel> channel) : channel_(std::move(channel)) {}
        Guard(Guard&& other) noexcept = default;
        Guard& operator=(Guard&& other) noexcept = default;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

    private:
        std::shared_ptr<Channel> channel_;
    };

    explicit ConnectionLock(asio::any_io_executor executor);

    [[nodiscard]] asio::awaitable<Guard> async_acquire();

    [[nodiscard]] bool is_locked() const;

private:
    std::shared_ptr<Channel> channel_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ServerConnection
// ─────────────────────────────────────────────────────────────────────────────

class ServerConnection {
public:
    ServerConnection(asio::any_io_executor executor, ServerConfig config, std::unique_ptr<IMessenger> messenger);
    ~ServerConnection();

    ServerConnection(const ServerConnection&) = delete;
    ServerConnection& operator=(const ServerConnection&) = delete;

    /// Start the transport and run the MCP handshake. Moves to Ready or Failed.
    [[nodiscard]] asio::awaitable<ProtocolResult<void>> async_start(
        std::unique_ptr<async::ITransport> transport,
        const Implementation& client_info,
        std::chrono::milliseconds init_timeout
    );

    /// Fetch tools (always) and prompts/resources/templates (when the server
    /// advertises them), caching tools and publishing each listing once.
    asio::awaitable<void> async_fetch_catalog();

    /// Spawn the idle watcher. It ends on its own once the connection
    /// leaves Ready or is destroyed.
    void start_watching();

    /// One locked round trip. Fails fast unless Ready.
    [[nodiscard]] asio::awaitable<RegistryResult<JsonRpcResponse>> async_request(
        std::string method,
        std::optional<Json> params = std::nullopt
    );

    [[nodiscard]] asio::awaitable<RegistryResult<std::vector<ToolSpec>>> async_refresh_tools();

    /// EOF to the child, Deinitialized, deinit event. Never waits.
    void shutdown();

    [[nodiscard]] const std::string& name() const noexcept { return config_.name; }
    [[nodiscard]] const ServerConfig& config() const noexcept { return config_; }
    [[nodiscard]] ConnectionState state() const noexcept { return state_; }
    [[nodiscard]] const std::vector<ToolSpec>& tools() const noexcept { return tools_; }
    [[nodiscard]] const ServerCapabilities& capabilities() const noexcept { return capabilities_; }
    [[nodiscard]] const std::optional<Implementation>& server_info() const noexcept { return server_info_; }

    /// Why the connection left Ready (empty otherwise)
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }

    [[nodiscard]] IMessenger& messenger() noexcept { return *messenger_; }

private:
    template <typename T>
    asio::awaitable<RegistryResult<std::vector<T>>> async_list_all(const std::string& method, const char* key);

    asio::awaitable<void> async_publish_prompts();
    asio::awaitable<void> async_watch();
    asio::awaitable<void> async_handle_unsolicited(JsonRpcMessage message);

    void on_protocol_failure(const ProtocolError& error);
    void mark_failed(std::string reason);
    void mark_deinitialized(std::string reason);

    asio::any_io_executor executor_;
    ServerConfig config_;
    std::unique_ptr<IMessenger> messenger_;
    std::unique_ptr<async::ProtocolClient> client_;
    ConnectionLock lock_;

    ConnectionState state_{ConnectionState::Uninitialized};
    ServerCapabilities capabilities_;
    std::optional<Implementation> server_info_;
    std::vector<ToolSpec> tools_;
    std::string last_error_;

    // Requests queued for the lock; the watcher yields while non-zero
    std::size_t waiting_{0};
    std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

}  // namespace toolmux
