#include <catch2/catch_test_macros.hpp>

#include "toolmux/protocol/request_id.hpp"

#include <set>

using namespace toolmux;

// ─────────────────────────────────────────────────────────────────────────────
// Decimal encoding
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("RequestId encodes small values", "[protocol][request_id]") {
    REQUIRE(RequestId{}.to_string() == "0");
    REQUIRE(RequestId::from_uint64(7).to_string() == "7");
    REQUIRE(RequestId::from_uint64(18446744073709551615ULL).to_string() == "18446744073709551615");
}

TEST_CASE("RequestId encodes values above 64 bits", "[protocol][request_id]") {
    RequestId id{1, 0};
    REQUIRE(id.to_string() == "18446744073709551616");

    RequestId max{~0ULL, ~0ULL};
    REQUIRE(max.to_string() == "340282366920938463463374607431768211455");
}

TEST_CASE("RequestId parses its own encoding", "[protocol][request_id]") {
    RequestId id{0x0123456789abcdefULL, 0xfedcba9876543210ULL};
    auto parsed = RequestId::parse(id.to_string());
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == id);
}

TEST_CASE("RequestId rejects malformed text", "[protocol][request_id]") {
    REQUIRE_FALSE(RequestId::parse("").has_value());
    REQUIRE_FALSE(RequestId::parse("-1").has_value());
    REQUIRE_FALSE(RequestId::parse("12a").has_value());
    REQUIRE_FALSE(RequestId::parse(" 1").has_value());

    SECTION("one past the maximum overflows") {
        REQUIRE_FALSE(RequestId::parse("340282366920938463463374607431768211456").has_value());
    }

    SECTION("too many digits") {
        REQUIRE_FALSE(RequestId::parse(std::string(40, '1')).has_value());
    }
}

TEST_CASE("RequestId::random draws distinct ids", "[protocol][request_id]") {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(RequestId::random().to_string());
    }
    REQUIRE(seen.size() == 1000);
}
