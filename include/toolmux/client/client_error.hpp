#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Errors
// ═══════════════════════════════════════════════════════════════════════════
// ProtocolError is what one round trip with a server can fail with.
// RegistryError wraps it with the failures the registry adds on top
// (unknown name, server not ready).

#include "toolmux/protocol/json_rpc.hpp"
#include "toolmux/transport.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace toolmux {

// ─────────────────────────────────────────────────────────────────────────────
// ProtocolError
// ─────────────────────────────────────────────────────────────────────────────

struct ProtocolError {
    enum class Kind {
        Transport,              ///< Underlying send/listen failed
        Timeout,                ///< Deadline hit; pending I/O was cancelled
        UnexpectedMessageType,  ///< Reply was not the response to our request
        ServerError             ///< Response carried a JSON-RPC error object
    };

    Kind kind{Kind::Transport};
    std::string message;
    std::optional<TransportError> cause;
    std::optional<JsonRpcError> rpc_error;

    [[nodiscard]] static ProtocolError transport(TransportError err) {
        std::string msg = err.message;
        return {Kind::Transport, std::move(msg), std::move(err), std::nullopt};
    }

    [[nodiscard]] static ProtocolError timeout(std::string msg) {
        return {Kind::Timeout, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ProtocolError unexpected_message(std::string msg) {
        return {Kind::UnexpectedMessageType, std::move(msg), std::nullopt, std::nullopt};
    }

    [[nodiscard]] static ProtocolError server_error(JsonRpcError err) {
        std::string msg = err.message;
        return {Kind::ServerError, std::move(msg), std::nullopt, std::move(err)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(ProtocolError::Kind kind) noexcept {
    switch (kind) {
        case ProtocolError::Kind::Transport:             return "Transport";
        case ProtocolError::Kind::Timeout:               return "Timeout";
        case ProtocolError::Kind::UnexpectedMessageType: return "UnexpectedMessageType";
        case ProtocolError::Kind::ServerError:           return "ServerError";
    }
    return "Unknown";
}

template <typename T>
using ProtocolResult = tl::expected<T, ProtocolError>;

// ─────────────────────────────────────────────────────────────────────────────
// RegistryError
// ─────────────────────────────────────────────────────────────────────────────

struct RegistryError {
    enum class Kind {
        UnknownServer,      ///< No connection with that name; nothing was sent
        ServerUnavailable,  ///< Connection exists but is not Ready
        Protocol            ///< The round trip itself failed
    };

    Kind kind{Kind::Protocol};
    std::string message;
    std::optional<ProtocolError> cause;

    [[nodiscard]] static RegistryError unknown_server(std::string_view name) {
        return {Kind::UnknownServer, "unknown server '" + std::string(name) + "'", std::nullopt};
    }

    [[nodiscard]] static RegistryError unavailable(std::string_view name, std::string_view state) {
        return {
            Kind::ServerUnavailable,
            "server '" + std::string(name) + "' is " + std::string(state),
            std::nullopt
        };
    }

    [[nodiscard]] static RegistryError protocol(ProtocolError err) {
        std::string msg = err.message;
        return {Kind::Protocol, std::move(msg), std::move(err)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(RegistryError::Kind kind) noexcept {
    switch (kind) {
        case RegistryError::Kind::UnknownServer:     return "UnknownServer";
        case RegistryError::Kind::ServerUnavailable: return "ServerUnavailable";
        case RegistryError::Kind::Protocol:          return "Protocol";
    }
    return "Unknown";
}

template <typename T>
using RegistryResult = tl::expected<T, RegistryError>;

}  // namespace toolmux
