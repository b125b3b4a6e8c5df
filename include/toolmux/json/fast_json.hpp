#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Line Decoder using simdjson
// ─────────────────────────────────────────────────────────────────────────────
//
// Tool servers write one JSON document per line. Incoming lines are parsed
// with simdjson's on-demand parser and converted to nlohmann::json, which
// the rest of the codebase uses for building and inspecting messages.
//
// USAGE:
//   JsonLineDecoder decoder;
//   auto doc = decoder.decode(line);
//   if (doc.has_value()) { ... }
//
// ─────────────────────────────────────────────────────────────────────────────

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace toolmux {

struct JsonParseError {
    std::string message;
};

using ParseResult = tl::expected<nlohmann::json, JsonParseError>;

struct JsonLineDecoderConfig {
    // Nesting limit; deeper documents are rejected rather than recursed into
    std::size_t max_depth{64};
};

class JsonLineDecoder {
public:
    JsonLineDecoder() = default;
    explicit JsonLineDecoder(JsonLineDecoderConfig config) : config_(config) {}

    /// Decode one line. A trailing "\r" is ignored.
    [[nodiscard]] ParseResult decode(std::string_view line);

    [[nodiscard]] const JsonLineDecoderConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] ParseResult convert(simdjson::ondemand::value value, std::size_t depth);

    simdjson::ondemand::parser parser_;
    JsonLineDecoderConfig config_;
};

/// True for lines holding only whitespace; the transport skips them
[[nodiscard]] bool is_blank_line(std::string_view line) noexcept;

}  // namespace toolmux
