#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared types used by every transport implementation.
//
// For the child-process transport, use: #include "toolmux/async/stdio_transport.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace toolmux {

using Json = nlohmann::json;

/// Error type for transport operations
struct TransportError {
    enum class Kind {
        Serialization,  ///< Line was not valid JSON or not a JSON-RPC envelope
        Io              ///< Pipe closed, EOF, missing handle, write failure
    };

    Kind kind{Kind::Io};
    std::string message;

    [[nodiscard]] static TransportError serialization(std::string msg) {
        return {Kind::Serialization, std::move(msg)};
    }

    [[nodiscard]] static TransportError io(std::string msg) {
        return {Kind::Io, std::move(msg)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Kind kind) noexcept {
    switch (kind) {
        case TransportError::Kind::Serialization: return "Serialization";
        case TransportError::Kind::Io:            return "Io";
    }
    return "Unknown";
}

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace toolmux
