// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "network/discovery.hpp"
#include "network/peer_id.hpp"
#include <catch2/catch_test_macros.hpp>
#include <set>
#include <string>
#include <unordered_set>

using namespace lanpeer::network;

TEST_CASE("PeerId - random identifiers", "[network][peer_id]") {
    SECTION("Default is null") {
        PeerId id;
        REQUIRE(id.IsNull());
        REQUIRE(id.ToString() == std::string(64, '0'));
    }

    SECTION("Random ids are distinct and non-null") {
        std::set<PeerId> seen;
        for (int i = 0; i < 1000; ++i) {
            PeerId id = PeerId::Random();
            REQUIRE_FALSE(id.IsNull());
            seen.insert(id);
        }
        REQUIRE(seen.size() == 1000);
    }

    SECTION("Usable as unordered key") {
        std::unordered_set<PeerId> ids;
        PeerId a = PeerId::Random();
        ids.insert(a);
        ids.insert(a);
        ids.insert(PeerId::Random());
        REQUIRE(ids.size() == 2);
        REQUIRE(ids.count(a) == 1);
    }
}

TEST_CASE("PeerId - hex form", "[network][peer_id]") {
    SECTION("ToString is 64 lowercase hex characters") {
        PeerId id = PeerId::Random();
        const std::string hex = id.ToString();
        REQUIRE(hex.size() == 64);
        for (char c : hex) {
            REQUIRE(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
        }
        REQUIRE(id.ShortString() == hex.substr(0, 10));
    }

    SECTION("FromHex inverts ToString") {
        PeerId id = PeerId::Random();
        auto parsed = PeerId::FromHex(id.ToString());
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == id);
    }

    SECTION("FromHex accepts uppercase") {
        auto parsed = PeerId::FromHex(std::string(64, 'A'));
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->ToString() == std::string(64, 'a'));
    }

    SECTION("FromHex rejects wrong length or characters") {
        REQUIRE_FALSE(PeerId::FromHex("").has_value());
        REQUIRE_FALSE(PeerId::FromHex(std::string(62, 'a')).has_value());
        REQUIRE_FALSE(PeerId::FromHex(std::string(66, 'a')).has_value());
        REQUIRE_FALSE(PeerId::FromHex(std::string(63, 'a') + "g").has_value());
    }
}

TEST_CASE("UserData - limits", "[network][user_data]") {
    SECTION("Short labels accepted") {
        auto data = UserData::Parse("bob");
        REQUIRE(data.has_value());
        REQUIRE(data->str() == "bob");
    }

    SECTION("Empty label accepted") {
        REQUIRE(UserData::Parse("").has_value());
    }

    SECTION("Exactly the maximum length is accepted") {
        REQUIRE(UserData::Parse(std::string(UserData::MAX_LENGTH, 'x')).has_value());
    }

    SECTION("One byte over is rejected with a reason") {
        std::string error;
        auto data = UserData::Parse(std::string(UserData::MAX_LENGTH + 1, 'x'),
                                    &error);
        REQUIRE_FALSE(data.has_value());
        REQUIRE(error.find("246") != std::string::npos);
        REQUIRE(error.find("245") != std::string::npos);
    }

    SECTION("Limit counts bytes, not characters") {
        // 123 two-byte characters = 246 bytes
        std::string text;
        for (int i = 0; i < 123; ++i) {
            text += "\xC3\xA9";
        }
        REQUIRE_FALSE(UserData::Parse(text).has_value());
        text.resize(text.size() - 2);
        REQUIRE(UserData::Parse(text).has_value());
    }

    SECTION("Invalid UTF-8 is rejected") {
        std::string error;
        REQUIRE_FALSE(UserData::Parse("bad\xFF", &error).has_value());
        REQUIRE(error == "user data is not valid UTF-8");
    }
}
