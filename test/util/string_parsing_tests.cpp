// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license
// Unit tests for string parsing utilities

#include "util/string_parsing.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace lanpeer::util;

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
        REQUIRE(*SafeParseInt("1", 1, 3600) == 1);
        REQUIRE(*SafeParseInt("3600", 1, 3600) == 3600);
    }
}

TEST_CASE("SafeParseInt - invalid inputs", "[util][string_parsing]") {
    SECTION("Empty string") {
        REQUIRE_FALSE(SafeParseInt("", 0, 100).has_value());
    }

    SECTION("Trailing characters") {
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
    }

    SECTION("Leading characters") {
        REQUIRE_FALSE(SafeParseInt("x42", 0, 100).has_value());
    }

    SECTION("Below minimum bound") {
        REQUIRE_FALSE(SafeParseInt("-1", 0, 100).has_value());
    }

    SECTION("Above maximum bound") {
        REQUIRE_FALSE(SafeParseInt("257", 0, 256).has_value());
    }

    SECTION("Overflow") {
        REQUIRE_FALSE(SafeParseInt("999999999999999999999", 0, 100).has_value());
    }

    SECTION("Whitespace") {
        REQUIRE_FALSE(SafeParseInt(" 42", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt("42 ", 0, 100).has_value());
    }

    SECTION("Floating point") {
        REQUIRE_FALSE(SafeParseInt("42.5", 0, 100).has_value());
    }
}

TEST_CASE("SafeParsePort", "[util][string_parsing]") {
    SECTION("Valid range") {
        REQUIRE(*SafeParsePort("1") == 1);
        REQUIRE(*SafeParsePort("45454") == 45454);
        REQUIRE(*SafeParsePort("65535") == 65535);
    }

    SECTION("Out of range or malformed") {
        REQUIRE_FALSE(SafeParsePort("0").has_value());
        REQUIRE_FALSE(SafeParsePort("65536").has_value());
        REQUIRE_FALSE(SafeParsePort("-1").has_value());
        REQUIRE_FALSE(SafeParsePort("").has_value());
        REQUIRE_FALSE(SafeParsePort("8080x").has_value());
    }
}

TEST_CASE("IsValidUtf8", "[util][string_parsing]") {
    SECTION("ASCII and empty") {
        REQUIRE(IsValidUtf8(""));
        REQUIRE(IsValidUtf8("bob"));
        REQUIRE(IsValidUtf8("alice-laptop 42"));
    }

    SECTION("Multi-byte sequences") {
        REQUIRE(IsValidUtf8("caf\xC3\xA9"));             // 2 bytes
        REQUIRE(IsValidUtf8("\xE2\x82\xAC"));            // 3 bytes (euro sign)
        REQUIRE(IsValidUtf8("\xF0\x9F\x98\x80"));        // 4 bytes (emoji)
        REQUIRE(IsValidUtf8("\xF4\x8F\xBF\xBF"));        // U+10FFFF
    }

    SECTION("Stray and truncated bytes") {
        REQUIRE_FALSE(IsValidUtf8("\x80"));
        REQUIRE_FALSE(IsValidUtf8("abc\xBF"));
        REQUIRE_FALSE(IsValidUtf8("\xC3"));
        REQUIRE_FALSE(IsValidUtf8("\xE2\x82"));
        REQUIRE_FALSE(IsValidUtf8("\xC3\x28"));
        REQUIRE_FALSE(IsValidUtf8("\xFF"));
    }

    SECTION("Overlong encodings") {
        REQUIRE_FALSE(IsValidUtf8("\xC0\xAF"));
        REQUIRE_FALSE(IsValidUtf8("\xE0\x80\xAF"));
        REQUIRE_FALSE(IsValidUtf8("\xF0\x80\x80\xAF"));
    }

    SECTION("Surrogates and out of range") {
        REQUIRE_FALSE(IsValidUtf8("\xED\xA0\x80"));      // U+D800
        REQUIRE_FALSE(IsValidUtf8("\xF4\x90\x80\x80"));  // above U+10FFFF
    }

    SECTION("Embedded NUL is valid") {
        REQUIRE(IsValidUtf8(std::string("a\0b", 3)));
    }
}

TEST_CASE("IsValidHex", "[util][string_parsing]") {
    SECTION("Valid inputs") {
        REQUIRE(IsValidHex("deadbeef"));
        REQUIRE(IsValidHex("DEADBEEF"));
        REQUIRE(IsValidHex("DeAdBeEf"));
        REQUIRE(IsValidHex("0"));
        REQUIRE(IsValidHex(std::string(1000, 'a')));
    }

    SECTION("Invalid inputs") {
        REQUIRE_FALSE(IsValidHex(""));
        REQUIRE_FALSE(IsValidHex("xyz"));
        REQUIRE_FALSE(IsValidHex("deadbeefg"));
        REQUIRE_FALSE(IsValidHex("dead beef"));
        REQUIRE_FALSE(IsValidHex("0x123"));
    }
}

TEST_CASE("ParseHex and ToHex", "[util][string_parsing]") {
    SECTION("Decode mixed case") {
        auto bytes = ParseHex("00fFa5");
        REQUIRE(bytes.has_value());
        REQUIRE(bytes->size() == 3);
        REQUIRE((*bytes)[0] == 0x00);
        REQUIRE((*bytes)[1] == 0xFF);
        REQUIRE((*bytes)[2] == 0xA5);
    }

    SECTION("Odd length rejected") {
        REQUIRE_FALSE(ParseHex("abc").has_value());
    }

    SECTION("Non-hex rejected") {
        REQUIRE_FALSE(ParseHex("zz").has_value());
    }

    SECTION("Encode is lowercase") {
        const uint8_t data[] = {0xDE, 0xAD, 0x01};
        REQUIRE(ToHex(data, sizeof(data)) == "dead01");
        REQUIRE(ToHex(data, 0).empty());
    }
}
