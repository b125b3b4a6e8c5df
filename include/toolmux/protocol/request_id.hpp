#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace toolmux {

// ─────────────────────────────────────────────────────────────────────────────
// RequestId - 128-bit JSON-RPC correlation id
// ─────────────────────────────────────────────────────────────────────────────
// Encoded on the wire as a decimal string, since JSON numbers handled by
// nlohmann::json stop at 64 bits. Decoding also accepts unsigned integers.

struct RequestId {
    std::uint64_t high{0};
    std::uint64_t low{0};

    /// Draw 128 random bits (unique within a connection lifetime in practice)
    [[nodiscard]] static RequestId random();

    [[nodiscard]] static RequestId from_uint64(std::uint64_t value) noexcept {
        return RequestId{0, value};
    }

    /// Parse a decimal string; nullopt on empty input, non-digits or overflow
    [[nodiscard]] static std::optional<RequestId> parse(std::string_view text);

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const RequestId&, const RequestId&) = default;
};

}  // namespace toolmux
