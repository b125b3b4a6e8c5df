#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// Coroutine-based message transport over ASIO.
//
// A transport is NOT safe for overlapping send/listen pairs issued by
// different logical calls. Callers serialize access (ToolManager holds a
// per-connection lock for the duration of a round trip).

#include "toolmux/protocol/json_rpc.hpp"
#include "toolmux/transport.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/use_awaitable.hpp>

namespace toolmux::async {

class ITransport {
public:
    virtual ~ITransport() = default;

    [[nodiscard]] virtual asio::any_io_executor get_executor() = 0;

    /// Bring the transport up (spawn the child, start readers)
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_start() = 0;

    /// Write one message
    [[nodiscard]] virtual asio::awaitable<TransportResult<void>> async_send(JsonRpcMessage message) = 0;

    /// Wait for the next message from the peer
    [[nodiscard]] virtual asio::awaitable<TransportResult<JsonRpcMessage>> async_listen() = 0;

    /// Close the outbound side (EOF to the peer). Never waits.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /// True once the peer is known to be gone (process exited, stream at EOF).
    /// Distinguishes a server that quit from one that merely misbehaved.
    [[nodiscard]] virtual bool peer_exited() { return false; }

    /// One-shot handshake: send the greeting request, then return whatever
    /// the peer answers first. Runs before any application traffic.
    [[nodiscard]] asio::awaitable<TransportResult<JsonRpcMessage>> async_init(JsonRpcRequest greeting) {
        auto sent = co_await async_send(JsonRpcMessage{std::move(greeting)});
        if (!sent) {
            co_return tl::unexpected(sent.error());
        }
        co_return co_await async_listen();
    }
};

}  // namespace toolmux::async
