// Unit tests for string parsing utilities
#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"

using namespace agentmesh::util;

TEST_CASE("SafeParseInt accepts in-range integers", "[util][string_parsing]") {
    REQUIRE(SafeParseInt("42", 0, 100) == 42);
    REQUIRE(SafeParseInt("-50", -100, 100) == -50);
    REQUIRE(SafeParseInt("0", 0, 100) == 0);
    REQUIRE(SafeParseInt("100", 0, 100) == 100);
}

TEST_CASE("SafeParseInt rejects malformed or out-of-range input", "[util][string_parsing]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    }

    SECTION("Trailing characters") {
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("5 ", 0, 100).has_value());
    }

    SECTION("Leading whitespace") {
        REQUIRE_FALSE(SafeParseInt(" 5", 0, 100).has_value());
    }

    SECTION("Outside bounds") {
        REQUIRE_FALSE(SafeParseInt("101", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
    }

    SECTION("Overflow") {
        REQUIRE_FALSE(SafeParseInt("99999999999999999999", 0, 100).has_value());
    }
}

TEST_CASE("SafeParsePort enforces 1-65535", "[util][string_parsing]") {
    REQUIRE(SafeParsePort("54321") == uint16_t{54321});
    REQUIRE(SafeParsePort("1") == uint16_t{1});
    REQUIRE(SafeParsePort("65535") == uint16_t{65535});
    REQUIRE_FALSE(SafeParsePort("0").has_value());
    REQUIRE_FALSE(SafeParsePort("65536").has_value());
    REQUIRE_FALSE(SafeParsePort("port").has_value());
}

TEST_CASE("SafeParseInt64 handles large values", "[util][string_parsing]") {
    REQUIRE(SafeParseInt64("86400000", 0, 100000000) == int64_t{86400000});
    REQUIRE_FALSE(SafeParseInt64("-1", 0, 10).has_value());
    REQUIRE_FALSE(SafeParseInt64("12abc", 0, 100).has_value());
}

TEST_CASE("SplitCommaList drops empty items", "[util][string_parsing]") {
    auto items = SplitCommaList("network,,mesh,");
    REQUIRE(items.size() == 2);
    CHECK(items[0] == "network");
    CHECK(items[1] == "mesh");

    CHECK(SplitCommaList("").empty());
    CHECK(SplitCommaList("all") == std::vector<std::string>{"all"});
}

TEST_CASE("IsBlank", "[util][string_parsing]") {
    CHECK(IsBlank(""));
    CHECK(IsBlank("   "));
    CHECK(IsBlank("\t\r\n "));
    CHECK_FALSE(IsBlank(" hi "));
}

TEST_CASE("TruncateUtf8 never splits a code point", "[util][string_parsing]") {
    SECTION("Short strings are untouched") {
        CHECK(TruncateUtf8("hello", 10) == "hello");
        CHECK(TruncateUtf8("hello", 5) == "hello");
    }

    SECTION("ASCII is cut at the limit") {
        CHECK(TruncateUtf8("hello world", 5) == "hello");
    }

    SECTION("Two-byte sequence straddling the limit is dropped") {
        // "h" + U+00E9 (C3 A9) + "llo"
        CHECK(TruncateUtf8("h\xC3\xA9llo", 2) == "h");
        CHECK(TruncateUtf8("h\xC3\xA9llo", 3) == "h\xC3\xA9");
    }

    SECTION("Four-byte sequence straddling the limit is dropped") {
        // U+1F600 (F0 9F 98 80)
        std::string s = "ab\xF0\x9F\x98\x80";
        CHECK(TruncateUtf8(s, 3) == "ab");
        CHECK(TruncateUtf8(s, 5) == "ab");
        CHECK(TruncateUtf8(s, 6) == s);
    }
}
