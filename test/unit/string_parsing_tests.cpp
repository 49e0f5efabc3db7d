// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/string_parsing.hpp"

#include <nlohmann/json.hpp>

using namespace ziacoin::util;

TEST_CASE("SafeParseInt", "[string_parsing]") {
    SECTION("Valid values") {
        REQUIRE(SafeParseInt("0", 0, 10) == 0);
        REQUIRE(SafeParseInt("10", 0, 10) == 10);
        REQUIRE(SafeParseInt("-5", -10, 10) == -5);
    }

    SECTION("Out of range") {
        REQUIRE_FALSE(SafeParseInt("11", 0, 10).has_value());
        REQUIRE_FALSE(SafeParseInt("-1", 0, 10).has_value());
        REQUIRE_FALSE(SafeParseInt64("99999999999999999999", 0, INT64_MAX).has_value());
    }

    SECTION("Garbage") {
        REQUIRE_FALSE(SafeParseInt("", 0, 10).has_value());
        REQUIRE_FALSE(SafeParseInt("42x", 0, 100).has_value());
        REQUIRE_FALSE(SafeParseInt(" 4", 0, 10).has_value());
        REQUIRE_FALSE(SafeParseInt("4.0", 0, 10).has_value());
    }
}

TEST_CASE("SafeParsePort", "[string_parsing]") {
    REQUIRE(SafeParsePort("8333") == 8333);
    REQUIRE(SafeParsePort("1") == 1);
    REQUIRE(SafeParsePort("65535") == 65535);
    REQUIRE_FALSE(SafeParsePort("0").has_value());
    REQUIRE_FALSE(SafeParsePort("65536").has_value());
    REQUIRE_FALSE(SafeParsePort("port").has_value());
}

TEST_CASE("SafeParseDouble", "[string_parsing]") {
    REQUIRE(SafeParseDouble("1.5") == 1.5);
    REQUIRE(SafeParseDouble("-2") == -2.0);
    REQUIRE_FALSE(SafeParseDouble("").has_value());
    REQUIRE_FALSE(SafeParseDouble("1.5coins").has_value());
    REQUIRE_FALSE(SafeParseDouble("nan").has_value());
    REQUIRE_FALSE(SafeParseDouble("inf").has_value());
    REQUIRE_FALSE(SafeParseDouble("1e999").has_value());
}

TEST_CASE("Hex helpers", "[string_parsing]") {
    SECTION("IsValidHex") {
        REQUIRE(IsValidHex("00ff"));
        REQUIRE(IsValidHex("ABCdef"));
        REQUIRE_FALSE(IsValidHex(""));
        REQUIRE_FALSE(IsValidHex("0g"));
        REQUIRE_FALSE(IsValidHex("0x00"));
    }

    SECTION("HexStr is lowercase") {
        std::vector<uint8_t> data = {0x00, 0xAB, 0x7f};
        REQUIRE(HexStr(data) == "00ab7f");
        REQUIRE(HexStr(std::vector<uint8_t>{}).empty());
    }

    SECTION("ParseHex") {
        auto bytes = ParseHex("00AbFf");
        REQUIRE(bytes.has_value());
        REQUIRE(*bytes == std::vector<uint8_t>{0x00, 0xab, 0xff});
        REQUIRE(ParseHex("")->empty());
        REQUIRE_FALSE(ParseHex("abc").has_value());
        REQUIRE_FALSE(ParseHex("zz").has_value());
    }
}

TEST_CASE("ParseHostPort", "[string_parsing]") {
    auto hp = ParseHostPort("seed.example.org:8333");
    REQUIRE(hp.has_value());
    REQUIRE(hp->first == "seed.example.org");
    REQUIRE(hp->second == 8333);

    hp = ParseHostPort("127.0.0.1:18333");
    REQUIRE(hp->first == "127.0.0.1");

    REQUIRE_FALSE(ParseHostPort("127.0.0.1").has_value());
    REQUIRE_FALSE(ParseHostPort(":8333").has_value());
    REQUIRE_FALSE(ParseHostPort("host:").has_value());
    REQUIRE_FALSE(ParseHostPort("host:0").has_value());
    REQUIRE_FALSE(ParseHostPort("host:99999").has_value());
}

TEST_CASE("SplitString", "[string_parsing]") {
    REQUIRE(SplitString("a,b,c", ',') == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(SplitString(",a,,b,", ',') == std::vector<std::string>{"a", "b"});
    REQUIRE(SplitString("", ',').empty());
    REQUIRE(SplitString("single", ',') == std::vector<std::string>{"single"});
}

TEST_CASE("JSON replies", "[string_parsing]") {
    SECTION("Error") {
        const std::string reply = JsonError("bad \"thing\"");
        REQUIRE(reply.back() == '\n');
        auto j = nlohmann::json::parse(reply);
        REQUIRE(j["error"] == "bad \"thing\"");
    }

    SECTION("Success") {
        auto j = nlohmann::json::parse(JsonSuccess("ok"));
        REQUIRE(j["result"] == "ok");
        REQUIRE_FALSE(j.contains("error"));
    }
}
