// Unit tests for string parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"
#include <cstdint>
#include <limits>

using namespace peerdial::util;

TEST_CASE("SafeParseInt - valid inputs", "[util][string_parsing]") {
    SECTION("Parse valid positive integer") {
        auto result = SafeParseInt("42", 0, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("Parse valid negative integer") {
        auto result = SafeParseInt("-50", -100, 100);
        REQUIRE(result.has_value());
        REQUIRE(*result == -50);
    }

    SECTION("Parse at both bounds") {
        REQUIRE(*SafeParseInt("0", 0, 100) == 0);
        REQUIRE(*SafeParseInt("100", 0, 100) == 100);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    }

    SECTION("Non-numeric string") {
        REQUIRE_FALSE(SafeParseInt("abc", 0, 100).has_value());
    }

    SECTION("Trailing characters") {
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
    }

    SECTION("Out of bounds") {
        REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
    }

    SECTION("Leading whitespace") {
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
    }

    SECTION("Floating point") {
        REQUIRE_FALSE(SafeParseInt("42.5", 0, 100).has_value());
    }
}

TEST_CASE("SafeParseInt64 - valid inputs", "[util][string_parsing]") {
    SECTION("Parse clean interval in seconds") {
        auto result = SafeParseInt64("900", 1, 604800);
        REQUIRE(result.has_value());
        REQUIRE(*result == 900);
    }

    SECTION("Parse beyond 32-bit range") {
        auto result = SafeParseInt64("4294967296", 0, std::numeric_limits<int64_t>::max());
        REQUIRE(result.has_value());
        REQUIRE(*result == 4294967296LL);
    }
}

TEST_CASE("SafeParseInt64 - invalid inputs", "[util][string_parsing]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt64("", 0, 1000).has_value());
    }

    SECTION("Below minimum") {
        REQUIRE_FALSE(SafeParseInt64("0", 1, 1000).has_value());
    }

    SECTION("Overflow") {
        REQUIRE_FALSE(SafeParseInt64("999999999999999999999", 0, std::numeric_limits<int64_t>::max()).has_value());
    }

    SECTION("Unit suffix") {
        REQUIRE_FALSE(SafeParseInt64("15m", 0, 1000).has_value());
    }
}
