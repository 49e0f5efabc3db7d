// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/message.hpp"
#include "network/protocol.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

using namespace ziacoin;
using namespace ziacoin::message;
using json = nlohmann::json;

TEST_CASE("Message encoding", "[message]") {
    HandshakeMessage hs;
    hs.host = "10.0.0.1";
    hs.port = 8333;
    hs.version = protocol::PROTOCOL_VERSION;
    hs.height = 42;

    const std::string line = EncodeMessage(hs);

    SECTION("One line of JSON tagged with its type") {
        REQUIRE(line.back() == '\n');
        REQUIRE(line.find('\n') == line.size() - 1);
        auto j = json::parse(line);
        REQUIRE(j["type"] == "handshake");
        REQUIRE(j["host"] == "10.0.0.1");
        REQUIRE(j["port"] == 8333);
        REQUIRE(j["height"] == 42);
    }

    SECTION("Decodes to the same variant alternative") {
        auto decoded = DecodeMessage(line);
        REQUIRE(decoded.has_value());
        REQUIRE(std::holds_alternative<HandshakeMessage>(*decoded));
        const auto& back = std::get<HandshakeMessage>(*decoded);
        REQUIRE(back.host == hs.host);
        REQUIRE(back.port == hs.port);
        REQUIRE(back.height == hs.height);
        REQUIRE(std::string(CommandOf(*decoded)) == protocol::commands::HANDSHAKE);
    }

    SECTION("Blocks keep their hashes across the wire") {
        auto params = chain::ChainParams::CreateRegTest();
        auto key = crypto::PrivateKey::Generate();
        auto blocks = test::BuildChain(*params, key, 2);

        auto decoded = DecodeMessage(EncodeMessage(BlocksMessage{blocks}));
        REQUIRE(decoded.has_value());
        const auto& back = std::get<BlocksMessage>(*decoded).blocks;
        REQUIRE(back.size() == 3);
        for (size_t i = 0; i < back.size(); ++i) {
            REQUIRE(back[i].hash == blocks[i].hash);
            REQUIRE(back[i].ComputeHash() == blocks[i].hash);
        }
    }
}

TEST_CASE("Message decoding rejects malformed input", "[message]") {
    SECTION("Unknown type") {
        REQUIRE_FALSE(DecodeMessage(R"({"type":"get_mempool"})").has_value());
        REQUIRE_FALSE(DecodeMessage(R"({"type":"HANDSHAKE","host":"a","port":1,"version":"1","height":0})").has_value());
    }

    SECTION("Missing or non-string type") {
        REQUIRE_FALSE(DecodeMessage(R"({"host":"a"})").has_value());
        REQUIRE_FALSE(DecodeMessage(R"({"type":7})").has_value());
    }

    SECTION("Not JSON or not an object") {
        REQUIRE_FALSE(DecodeMessage("hello").has_value());
        REQUIRE_FALSE(DecodeMessage("[1,2,3]").has_value());
        REQUIRE_FALSE(DecodeMessage("").has_value());
        REQUIRE_FALSE(DecodeMessage("\n").has_value());
    }

    SECTION("Mistyped fields") {
        REQUIRE_FALSE(DecodeMessage(R"({"type":"handshake","host":"a","port":"8333","version":"1","height":0})").has_value());
        REQUIRE_FALSE(DecodeMessage(R"({"type":"handshake","host":"a","port":70000,"version":"1","height":0})").has_value());
        REQUIRE_FALSE(DecodeMessage(R"({"type":"get_blocks","start_height":0})").has_value());
        REQUIRE_FALSE(DecodeMessage(R"({"type":"blocks","blocks":{}})").has_value());
        REQUIRE_FALSE(DecodeMessage(R"({"type":"new_transaction","transaction":{"sender":"a"}})").has_value());
    }

    SECTION("Oversized peer list") {
        json j;
        j["type"] = "peer_list";
        j["peers"] = json::array();
        for (size_t i = 0; i <= protocol::MAX_PEER_LIST_SIZE; ++i) {
            j["peers"].push_back({{"host", "10.0.0.1"}, {"port", 1000 + static_cast<int>(i)}});
        }
        REQUIRE_FALSE(DecodeMessage(j.dump()).has_value());

        j["peers"].erase(j["peers"].size() - 1);
        auto decoded = DecodeMessage(j.dump());
        REQUIRE(decoded.has_value());
        REQUIRE(std::get<PeerListMessage>(*decoded).peers.size() == protocol::MAX_PEER_LIST_SIZE);
    }

    SECTION("Messages with no payload") {
        auto decoded = DecodeMessage(R"({"type":"get_peers"})");
        REQUIRE(decoded.has_value());
        REQUIRE(std::holds_alternative<GetPeersMessage>(*decoded));
    }

    SECTION("Trailing carriage return is tolerated") {
        REQUIRE(DecodeMessage("{\"type\":\"get_peers\"}\r\n").has_value());
    }
}
