#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Protocol Client
// ═══════════════════════════════════════════════════════════════════════════
// Request/response on top of one transport. Every call is exactly one
// send followed by (for requests) a listen, each raced against a
// steady_timer. The loser of the race is cancelled; the child process is
// left running on timeout, and the ids of timed-out requests are kept so
// their responses can be dropped if they turn up later.
//
// No pipelining: callers must not overlap calls on the same client. Between
// calls the owner may wait in async_listen_idle for unsolicited messages;
// interrupt_idle ends that wait so a call can start.

#include "toolmux/async/async_transport.hpp"
#include "toolmux/client/client_error.hpp"
#include "toolmux/protocol/mcp_types.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>

#include <asio/cancellation_signal.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>

namespace toolmux::async {

struct ProtocolClientConfig {
    std::chrono::milliseconds send_timeout{120'000};
    std::chrono::milliseconds listen_timeout{120'000};
    /// Bound on the whole initialize exchange
    std::chrono::milliseconds init_timeout{120'000};
};

class ProtocolClient {
public:
    ProtocolClient(std::unique_ptr<ITransport> transport, ProtocolClientConfig config = {});

    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    /// Send a request with a fresh id and wait for its response. A reply
    /// that is not the response to this id is UnexpectedMessageType; a
    /// JSON-RPC error object is ServerError.
    [[nodiscard]] asio::awaitable<ProtocolResult<JsonRpcResponse>> async_request(
        std::string method,
        std::optional<Json> params = std::nullopt
    );

    /// Fire-and-forget; only the send is timed
    [[nodiscard]] asio::awaitable<ProtocolResult<void>> async_notify(
        std::string method,
        std::optional<Json> params = std::nullopt
    );

    /// MCP handshake: `initialize` through the transport's one-shot init,
    /// then `notifications/initialized`
    [[nodiscard]] asio::awaitable<ProtocolResult<InitializeResult>> async_initialize(
        Implementation client_info
    );

    /// Wait for whatever the server sends next, with no deadline. nullopt
    /// when interrupt_idle() ended the wait. The client may be destroyed
    /// while this is suspended.
    [[nodiscard]] asio::awaitable<std::optional<TransportResult<JsonRpcMessage>>> async_listen_idle();

    /// Cancel a pending async_listen_idle; no-op when none is pending
    void interrupt_idle();

    /// True, once, for the id of a request that timed out
    bool forget_abandoned(const RequestId& id);

    [[nodiscard]] ITransport& transport() noexcept { return *transport_; }
    [[nodiscard]] const ProtocolClientConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] ProtocolResult<JsonRpcResponse> expect_response(
        JsonRpcMessage reply,
        const RequestId& id,
        const std::string& method
    ) const;

    struct IdleWait {
        asio::cancellation_signal signal;
        bool interrupted{false};
    };

    static constexpr std::size_t kMaxAbandoned = 16;

    void abandon(const RequestId& id);

    // Shared so an op abandoned after a timeout can still finish safely
    std::shared_ptr<ITransport> transport_;
    ProtocolClientConfig config_;
    std::deque<RequestId> abandoned_;
    std::weak_ptr<IdleWait> idle_wait_;
};

}  // namespace toolmux::async
