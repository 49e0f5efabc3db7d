// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "chain/chainparams.hpp"
#include "chain/ledger.hpp"
#include "chain/miner.hpp"
#include "chain/validation.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

using namespace ziacoin;
using namespace ziacoin::chain;
using namespace ziacoin::test;
using ziacoin::mining::MiningEngine;

namespace {

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace

TEST_CASE("MiningEngine - mine one block", "[miner]") {
    TempDir dir;
    auto params = ChainParams::CreateRegTest();
    Ledger ledger(*params, dir.path());
    REQUIRE(ledger.Initialize());
    MiningEngine miner(ledger, *params);
    auto key = crypto::PrivateKey::Generate();

    SECTION("Empty pool yields nothing") {
        REQUIRE_FALSE(miner.MinePendingTransactions().has_value());
        REQUIRE(ledger.GetHeight() == 0);
    }

    SECTION("Pending transactions are sealed into the next block") {
        validation::ValidationState state;
        REQUIRE(ledger.AddTransaction(MakeTransaction(key, "alice", 1.0), state));
        REQUIRE(ledger.AddTransaction(MakeTransaction(key, "bob", 2.0), state));

        std::vector<Block> found;
        miner.SetBlockFoundCallback([&](const Block& b) { found.push_back(b); });

        auto block = miner.MinePendingTransactions();
        REQUIRE(block.has_value());
        REQUIRE(block->index == 1);
        REQUIRE(block->previous_hash == params->GenesisBlock().hash);
        REQUIRE(block->transactions.size() == 2);
        REQUIRE(block->hash == block->ComputeHash());
        REQUIRE(consensus::HashMeetsDifficulty(block->hash, block->difficulty));

        REQUIRE(ledger.GetHeight() == 1);
        REQUIRE(ledger.GetPendingCount() == 0);
        REQUIRE(ledger.IsChainValid());
        REQUIRE(found.size() == 1);
        REQUIRE(found[0].hash == block->hash);
        REQUIRE(miner.GetBlocksFound() == 1);
        REQUIRE(miner.GetState() == MiningEngine::State::Idle);

        // Regtest keeps its difficulty
        REQUIRE(ledger.GetDifficulty() == params->GetConsensus().nInitialDifficulty);
    }
}

TEST_CASE("MiningEngine - retargets after a fast block", "[miner][pow]") {
    TempDir dir;
    auto params = ChainParams::CreateTestNet();
    Ledger ledger(*params, dir.path());
    REQUIRE(ledger.Initialize());
    MiningEngine miner(ledger, *params);
    auto key = crypto::PrivateKey::Generate();

    const int before = ledger.GetDifficulty();
    validation::ValidationState state;
    REQUIRE(ledger.AddTransaction(MakeTransaction(key, "alice", 1.0), state));
    auto block = miner.MinePendingTransactions();
    REQUIRE(block.has_value());
    REQUIRE(block->difficulty == before);
    // Far quicker than half the target block time
    REQUIRE(ledger.GetDifficulty() == before + 1);
}

TEST_CASE("MiningEngine - cancellation returns transactions", "[miner]") {
    TempDir dir;
    auto params = ChainParams::CreateRegTest();
    Ledger ledger(*params, dir.path());
    REQUIRE(ledger.Initialize());
    MiningEngine miner(ledger, *params);
    auto key = crypto::PrivateKey::Generate();

    auto tx = MakeTransaction(key, "alice", 1.0);
    validation::ValidationState state;
    REQUIRE(ledger.AddTransaction(tx, state));

    // Out of reach, so the search only ends by cancellation
    ledger.SetDifficulty(64);

    auto attempt = std::async(std::launch::async, [&]() { return miner.MinePendingTransactions(); });
    REQUIRE(WaitFor([&]() { return miner.GetState() == MiningEngine::State::Searching; }));
    REQUIRE(ledger.GetPendingCount() == 0);

    miner.Interrupt();
    auto result = attempt.get();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(ledger.GetHeight() == 0);
    REQUIRE(ledger.GetPendingCount() == 1);
    REQUIRE(ledger.GetPending()[0] == tx);
    REQUIRE(miner.GetState() == MiningEngine::State::Idle);
}

TEST_CASE("MiningEngine - start and stop", "[miner]") {
    TempDir dir;
    auto params = ChainParams::CreateRegTest();
    Ledger ledger(*params, dir.path());
    REQUIRE(ledger.Initialize());
    MiningEngine miner(ledger, *params);
    auto key = crypto::PrivateKey::Generate();

    SECTION("Double start prevented and double stop safe") {
        REQUIRE(miner.Start());
        REQUIRE(miner.IsMining());
        REQUIRE_FALSE(miner.Start());
        miner.Stop();
        miner.Stop();
        REQUIRE_FALSE(miner.IsMining());
    }

    SECTION("Worker mines transactions as they arrive") {
        REQUIRE(miner.Start());
        validation::ValidationState state;
        REQUIRE(ledger.AddTransaction(MakeTransaction(key, "alice", 1.0), state));
        miner.NotifyNewTransaction();

        REQUIRE(WaitFor([&]() { return ledger.GetHeight() == 1; }));
        miner.Stop();
        REQUIRE(ledger.GetPendingCount() == 0);
        REQUIRE(miner.GetBlocksFound() == 1);
    }

    SECTION("Stop cancels a search in progress") {
        ledger.SetDifficulty(64);
        validation::ValidationState state;
        REQUIRE(ledger.AddTransaction(MakeTransaction(key, "alice", 1.0), state));
        REQUIRE(miner.Start());
        REQUIRE(WaitFor([&]() { return miner.GetState() == MiningEngine::State::Searching; }));

        miner.Stop();
        REQUIRE_FALSE(miner.IsMining());
        REQUIRE(ledger.GetPendingCount() == 1);
        REQUIRE(ledger.GetHeight() == 0);
    }

    SECTION("Tip moving under the miner abandons the stale candidate") {
        ledger.SetDifficulty(64);
        auto tx = MakeTransaction(key, "alice", 1.0);
        validation::ValidationState state;
        REQUIRE(ledger.AddTransaction(tx, state));
        REQUIRE(miner.Start());
        REQUIRE(WaitFor([&]() { return miner.GetState() == MiningEngine::State::Searching; }));

        // A block arrives from elsewhere
        Block incoming = SealBlock(ledger.GetTip(), {MakeTransaction(key, "bob", 2.0)}, 1);
        REQUIRE(ledger.AppendBlock(incoming, state));
        ledger.SetDifficulty(1);
        miner.Interrupt();

        // The next attempt builds on the new tip with the returned transaction
        REQUIRE(WaitFor([&]() { return ledger.GetHeight() == 2; }));
        miner.Stop();
        auto tip = ledger.GetTip();
        REQUIRE(tip.previous_hash == incoming.hash);
        REQUIRE(tip.transactions.size() == 1);
        REQUIRE(tip.transactions[0] == tx);
    }
}
