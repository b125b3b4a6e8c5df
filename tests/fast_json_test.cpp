#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "toolmux/json/fast_json.hpp"

#include <string>

using namespace toolmux;
using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Line decoding
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("JsonLineDecoder decodes a JSON-RPC line", "[json][simdjson]") {
    JsonLineDecoder decoder;
    auto result = decoder.decode(R"({"jsonrpc":"2.0","id":"1","result":{"tools":[{"name":"status"}]}})");

    REQUIRE(result.has_value());
    REQUIRE((*result)["jsonrpc"] == "2.0");
    REQUIRE((*result)["result"]["tools"][0]["name"] == "status");
}

TEST_CASE("JsonLineDecoder preserves value types", "[json][simdjson]") {
    JsonLineDecoder decoder;
    auto result = decoder.decode(R"({
        "string": "hello", "integer": -17, "unsigned": 18446744073709551615,
        "float": 3.14159, "yes": true, "no": false, "nothing": null,
        "list": [1, "two"], "nested": {"deep": {"key": "value"}}
    })");

    REQUIRE(result.has_value());
    const auto& j = *result;
    REQUIRE(j["string"] == "hello");
    REQUIRE(j["integer"].get<std::int64_t>() == -17);
    REQUIRE(j["unsigned"].get<std::uint64_t>() == 18446744073709551615ULL);
    REQUIRE_THAT(j["float"].get<double>(), Catch::Matchers::WithinRel(3.14159, 0.00001));
    REQUIRE(j["yes"] == true);
    REQUIRE(j["no"] == false);
    REQUIRE(j["nothing"].is_null());
    REQUIRE(j["list"].size() == 2);
    REQUIRE(j["nested"]["deep"]["key"] == "value");
}

TEST_CASE("JsonLineDecoder unescapes strings", "[json][simdjson]") {
    JsonLineDecoder decoder;
    auto result = decoder.decode(R"({"text": "line1\nline2 世界"})");

    REQUIRE(result.has_value());
    REQUIRE((*result)["text"] == "line1\nline2 世界");
}

TEST_CASE("JsonLineDecoder ignores a trailing carriage return", "[json][simdjson]") {
    JsonLineDecoder decoder;
    auto result = decoder.decode("{\"a\":1}\r");

    REQUIRE(result.has_value());
    REQUIRE((*result)["a"] == 1);
}

TEST_CASE("JsonLineDecoder can be reused across lines", "[json][simdjson]") {
    JsonLineDecoder decoder;
    for (int i = 0; i < 5; ++i) {
        auto result = decoder.decode("{\"n\":" + std::to_string(i) + "}");
        REQUIRE(result.has_value());
        REQUIRE((*result)["n"] == i);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("JsonLineDecoder rejects invalid JSON", "[json][simdjson]") {
    JsonLineDecoder decoder;
    REQUIRE_FALSE(decoder.decode(R"({"key": )").has_value());
    REQUIRE_FALSE(decoder.decode("not json").has_value());
}

TEST_CASE("JsonLineDecoder rejects trailing content", "[json][simdjson]") {
    JsonLineDecoder decoder;
    auto result = decoder.decode(R"({"a":1} {"b":2})");
    REQUIRE_FALSE(result.has_value());
}

TEST_CASE("JsonLineDecoder enforces the depth limit", "[json][simdjson]") {
    JsonLineDecoder decoder(JsonLineDecoderConfig{4});

    auto shallow = decoder.decode(R"({"a":{"b":{"c":1}}})");
    REQUIRE(shallow.has_value());

    auto deep = decoder.decode(R"({"a":{"b":{"c":{"d":{"e":{"f":1}}}}}})");
    REQUIRE_FALSE(deep.has_value());
    REQUIRE(deep.error().message.find("depth") != std::string::npos);
}

TEST_CASE("is_blank_line", "[json]") {
    REQUIRE(is_blank_line(""));
    REQUIRE(is_blank_line("   \t"));
    REQUIRE(is_blank_line("\r"));
    REQUIRE_FALSE(is_blank_line(" {} "));
    REQUIRE_FALSE(is_blank_line("null"));
}
