// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "chain/merkle.hpp"
#include "chain/pow.hpp"
#include "chain/validation.hpp"
#include "crypto/sha256.hpp"
#include "test_helpers.hpp"

using namespace ziacoin;
using namespace ziacoin::chain;
using namespace ziacoin::test;
namespace reject = ziacoin::validation::reject;

TEST_CASE("Genesis block", "[chain][genesis]") {
    for (auto type : {ChainType::MAIN, ChainType::TESTNET, ChainType::REGTEST}) {
        auto params = ChainParams::Create(type);
        const Block& genesis = params->GenesisBlock();

        REQUIRE(genesis.index == 0);
        REQUIRE(genesis.previous_hash == std::string(64, '0'));
        REQUIRE(genesis.transactions.empty());
        REQUIRE(genesis.nonce == 0);
        REQUIRE(genesis.hash == genesis.ComputeHash());
        REQUIRE(genesis.merkle_root == crypto::Sha256Hex(""));

        // Genesis is exempt from proof-of-work
        validation::ValidationState state;
        REQUIRE(validation::CheckBlock(genesis, state));
    }

    SECTION("Every node derives the same genesis") {
        auto a = ChainParams::CreateMainNet();
        auto b = ChainParams::CreateMainNet();
        REQUIRE(a->GenesisBlock().hash == b->GenesisBlock().hash);
        REQUIRE(a->GenesisBlock().hash != ChainParams::CreateTestNet()->GenesisBlock().hash);
    }
}

TEST_CASE("Chain parameters", "[chain][chainparams]") {
    auto main = ChainParams::CreateMainNet();
    auto regtest = ChainParams::CreateRegTest();

    REQUIRE(main->GetChainTypeString() == "main");
    REQUIRE(regtest->GetChainTypeString() == "regtest");
    REQUIRE_FALSE(main->GetConsensus().fPowNoRetargeting);
    REQUIRE(regtest->GetConsensus().fPowNoRetargeting);
    REQUIRE(regtest->GetConsensus().nInitialDifficulty == 1);

    SECTION("Initial difficulty override rebuilds genesis") {
        const std::string before = regtest->GenesisBlock().hash;
        regtest->SetInitialDifficulty(3);
        REQUIRE(regtest->GenesisBlock().difficulty == 3);
        REQUIRE(regtest->GenesisBlock().hash != before);
    }
}

TEST_CASE("Proof-of-work difficulty check", "[chain][pow]") {
    REQUIRE(consensus::HashMeetsDifficulty("00ab", 2));
    REQUIRE_FALSE(consensus::HashMeetsDifficulty("0abc", 2));
    REQUIRE(consensus::HashMeetsDifficulty("abcd", 0));
    REQUIRE_FALSE(consensus::HashMeetsDifficulty("00", 3));

    SECTION("Sealed blocks satisfy their difficulty") {
        auto params = ChainParams::CreateRegTest();
        for (int difficulty : {1, 2, 3}) {
            Block block = SealBlock(params->GenesisBlock(), {}, difficulty);
            REQUIRE(block.hash.substr(0, difficulty) == std::string(difficulty, '0'));
            validation::ValidationState state;
            REQUIRE(validation::CheckBlock(block, state));
        }
    }
}

TEST_CASE("Difficulty adjustment", "[chain][pow]") {
    const double target = 60.0;

    REQUIRE(consensus::AdjustDifficulty(4, 0.4 * target, target) == 5);
    REQUIRE(consensus::AdjustDifficulty(4, 3.0 * target, target) == 3);
    REQUIRE(consensus::AdjustDifficulty(4, target, target) == 4);

    // Bounds of the band are inclusive
    REQUIRE(consensus::AdjustDifficulty(4, 0.5 * target, target) == 4);
    REQUIRE(consensus::AdjustDifficulty(4, 2.0 * target, target) == 4);

    SECTION("Never drops below the minimum") {
        REQUIRE(consensus::AdjustDifficulty(1, 3.0 * target, target) == consensus::MIN_DIFFICULTY);
    }
}

TEST_CASE("Merkle root", "[chain][merkle]") {
    auto key = crypto::PrivateKey::Generate();
    auto a = MakeTransaction(key, "alice", 1.0, 1000.0);
    auto b = MakeTransaction(key, "bob", 2.0, 1001.0);
    auto c = MakeTransaction(key, "carol", 3.0, 1002.0);

    SECTION("Empty list commits to sha256 of the empty string") {
        REQUIRE(consensus::ComputeMerkleRoot({}) == crypto::Sha256Hex(""));
    }

    SECTION("Deterministic") {
        REQUIRE(consensus::ComputeMerkleRoot({a, b, c}) == consensus::ComputeMerkleRoot({a, b, c}));
    }

    SECTION("Order matters") {
        REQUIRE(consensus::ComputeMerkleRoot({a, b}) != consensus::ComputeMerkleRoot({b, a}));
    }

    SECTION("Odd level duplicates the last entry") {
        const std::string ha = crypto::Sha256Hex(CanonicalJson(a.ToJson()));
        const std::string hb = crypto::Sha256Hex(CanonicalJson(b.ToJson()));
        const std::string hc = crypto::Sha256Hex(CanonicalJson(c.ToJson()));
        const std::string left = crypto::Sha256Hex(ha + hb);
        const std::string right = crypto::Sha256Hex(hc + hc);
        REQUIRE(consensus::ComputeMerkleRoot({a, b, c}) == crypto::Sha256Hex(left + right));
    }

    SECTION("Single transaction root is its leaf") {
        REQUIRE(consensus::ComputeMerkleRoot({a}) == crypto::Sha256Hex(CanonicalJson(a.ToJson())));
    }
}

TEST_CASE("Block hashing and JSON", "[chain][block]") {
    auto params = ChainParams::CreateRegTest();
    auto key = crypto::PrivateKey::Generate();
    Block block = SealBlock(params->GenesisBlock(), {MakeTransaction(key, "alice", 5.0)}, 1);

    SECTION("Hash commits to every field") {
        Block changed = block;
        changed.nonce += 1;
        REQUIRE(changed.ComputeHash() != block.hash);

        changed = block;
        changed.transactions[0].amount = 6.0;
        REQUIRE(changed.ComputeHash() != block.hash);
    }

    SECTION("Survives JSON") {
        auto parsed = Block::FromJson(nlohmann::json::parse(block.ToJson().dump()));
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->hash == block.hash);
        REQUIRE(parsed->ComputeHash() == block.hash);
        REQUIRE(parsed->transactions.size() == 1);
        REQUIRE(parsed->transactions[0] == block.transactions[0]);
    }

    SECTION("Missing fields are rejected") {
        auto j = block.ToJson();
        j.erase("merkle_root");
        REQUIRE_FALSE(Block::FromJson(j).has_value());
    }

    SECTION("Nonce is required and must be unsigned") {
        auto j = block.ToJson();
        j.erase("nonce");
        REQUIRE_FALSE(Block::FromJson(j).has_value());

        j = block.ToJson();
        j["nonce"] = -1;
        REQUIRE_FALSE(Block::FromJson(j).has_value());

        j = block.ToJson();
        j["nonce"] = "7";
        REQUIRE_FALSE(Block::FromJson(j).has_value());
    }
}

TEST_CASE("CheckBlock rejections", "[chain][validation]") {
    auto params = ChainParams::CreateRegTest();
    auto key = crypto::PrivateKey::Generate();
    Block block = SealBlock(params->GenesisBlock(), {MakeTransaction(key, "alice", 5.0)}, 2);
    validation::ValidationState state;

    SECTION("Stored hash must match") {
        block.hash = std::string(64, '0');
        REQUIRE_FALSE(validation::CheckBlock(block, state));
        REQUIRE(state.GetRejectReason() == reject::BAD_HASH);
    }

    SECTION("Merkle root must commit to the transactions") {
        block.merkle_root = crypto::Sha256Hex("other");
        block.hash = block.ComputeHash();
        REQUIRE_FALSE(validation::CheckBlock(block, state));
        REQUIRE(state.GetRejectReason() == reject::BAD_MERKLE);
    }

    SECTION("Hash must meet the declared difficulty") {
        // Bump the declared difficulty until the existing nonce fails it
        do {
            block.difficulty += 1;
            block.hash = block.ComputeHash();
        } while (consensus::HashMeetsDifficulty(block.hash, block.difficulty));
        REQUIRE_FALSE(validation::CheckBlock(block, state));
        REQUIRE(state.GetRejectReason() == reject::HIGH_HASH);
    }

    SECTION("Difficulty zero is not allowed after genesis") {
        block.difficulty = 0;
        block.hash = block.ComputeHash();
        REQUIRE_FALSE(validation::CheckBlock(block, state));
        REQUIRE(state.GetRejectReason() == reject::BAD_DIFFICULTY);
    }
}

TEST_CASE("Chain validity and tamper detection", "[chain][validation]") {
    auto params = ChainParams::CreateRegTest();
    auto key = crypto::PrivateKey::Generate();
    auto blocks = BuildChain(*params, key, 4);
    validation::ValidationState state;

    REQUIRE(validation::CheckChain(blocks, state));

    SECTION("Editing a confirmed transaction breaks the hash") {
        blocks[2].transactions[0].amount = 1000.0;
        REQUIRE_FALSE(validation::CheckChain(blocks, state));
        REQUIRE(state.GetRejectReason() == reject::BAD_HASH);
    }

    SECTION("Re-hashing an edited block breaks the merkle commitment") {
        blocks[2].transactions[0].amount = 1000.0;
        blocks[2].hash = blocks[2].ComputeHash();
        REQUIRE_FALSE(validation::CheckChain(blocks, state));
        REQUIRE(state.GetRejectReason() == reject::BAD_MERKLE);
    }

    SECTION("Arbitrary merkle root with a valid seal") {
        blocks[1].merkle_root = std::string(64, 'f');
        MineNonce(blocks[1]);
        for (size_t i = 2; i < blocks.size(); ++i) {
            blocks[i].previous_hash = blocks[i - 1].hash;
            MineNonce(blocks[i]);
        }
        REQUIRE_FALSE(validation::CheckChain(blocks, state));
        REQUIRE(state.GetRejectReason() == reject::BAD_MERKLE);
    }

    SECTION("Unmined block in the middle") {
        blocks[2].difficulty = 4;
        do {
            ++blocks[2].nonce;
            blocks[2].hash = blocks[2].ComputeHash();
        } while (consensus::HashMeetsDifficulty(blocks[2].hash, blocks[2].difficulty));
        for (size_t i = 3; i < blocks.size(); ++i) {
            blocks[i].previous_hash = blocks[i - 1].hash;
            MineNonce(blocks[i]);
        }
        REQUIRE_FALSE(validation::CheckChain(blocks, state));
        REQUIRE(state.GetRejectReason() == reject::HIGH_HASH);
    }

    SECTION("Forged signature") {
        auto other = crypto::PrivateKey::Generate();
        blocks[1].transactions[0].signature = other.Sign(blocks[1].transactions[0].SignatureMessage());
        blocks[1].merkle_root = consensus::ComputeMerkleRoot(blocks[1].transactions);
        MineNonce(blocks[1]);
        for (size_t i = 2; i < blocks.size(); ++i) {
            blocks[i].previous_hash = blocks[i - 1].hash;
            MineNonce(blocks[i]);
        }
        REQUIRE_FALSE(validation::CheckChain(blocks, state));
        REQUIRE(state.GetRejectReason() == reject::BAD_TX);
    }

    SECTION("Transaction replayed in a later block") {
        blocks[3] = SealBlock(blocks[2], {blocks[1].transactions[0]}, 1);
        blocks[4] = SealBlock(blocks[3], blocks[4].transactions, 1);
        REQUIRE_FALSE(validation::CheckChain(blocks, state));
        REQUIRE(state.GetRejectReason() == reject::DUPLICATE_TX);
    }

    SECTION("Transaction repeated within one block") {
        auto tx = blocks[2].transactions[0];
        blocks[2] = SealBlock(blocks[1], {tx, tx}, 1);
        for (size_t i = 3; i < blocks.size(); ++i) {
            blocks[i] = SealBlock(blocks[i - 1], blocks[i].transactions, 1);
        }
        REQUIRE_FALSE(validation::CheckChain(blocks, state));
        REQUIRE(state.GetRejectReason() == reject::DUPLICATE_TX);
    }

    SECTION("A genesis-only chain is valid") {
        REQUIRE(validation::CheckChain({params->GenesisBlock()}, state));
    }
}

TEST_CASE("Transaction freshness window", "[chain][validation]") {
    auto params = ChainParams::CreateRegTest();
    auto key = crypto::PrivateKey::Generate();
    const int64_t now = 1800000000;
    util::MockTimeScope mock(now);
    const int64_t window = params->GetConsensus().nMaxTxAge;
    validation::ValidationState state;

    REQUIRE(validation::CheckTransaction(MakeTransaction(key, "bob", 1.0, now), *params, state));
    REQUIRE(validation::CheckTransaction(MakeTransaction(key, "bob", 1.0, now - window), *params, state));
    REQUIRE(validation::CheckTransaction(MakeTransaction(key, "bob", 1.0, now + window), *params, state));

    SECTION("Too old") {
        REQUIRE_FALSE(validation::CheckTransaction(
            MakeTransaction(key, "bob", 1.0, now - window - 1), *params, state));
        REQUIRE(state.GetRejectReason() == reject::STALE_TX);
    }

    SECTION("Too far in the future") {
        REQUIRE_FALSE(validation::CheckTransaction(
            MakeTransaction(key, "bob", 1.0, now + window + 1), *params, state));
        REQUIRE(state.GetRejectReason() == reject::STALE_TX);
    }

    SECTION("Amount must be positive") {
        REQUIRE_FALSE(validation::CheckTransaction(MakeTransaction(key, "bob", 0.0, now), *params, state));
        REQUIRE(state.GetRejectReason() == reject::BAD_AMOUNT);
        REQUIRE_FALSE(validation::CheckTransaction(MakeTransaction(key, "bob", -5.0, now), *params, state));
    }
}
