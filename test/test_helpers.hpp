// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Shared fixtures: scratch directories, signed transactions, sealed blocks

#pragma once

#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "chain/merkle.hpp"
#include "chain/pow.hpp"
#include "chain/transaction.hpp"
#include "crypto/ecdsa.hpp"
#include "util/time.hpp"

#include <atomic>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace ziacoin {
namespace test {

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& tag = "ziacoin_test") {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                (tag + "_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline chain::Transaction MakeTransaction(const crypto::PrivateKey& key,
                                          const std::string& recipient,
                                          double amount,
                                          double timestamp = util::GetTimeSeconds()) {
    chain::Transaction tx;
    tx.sender = key.GetPublicKeyHex();
    tx.recipient = recipient;
    tx.amount = amount;
    tx.timestamp = timestamp;
    tx.signature = key.Sign(tx.SignatureMessage());
    return tx;
}

// Brute-force a nonce over the block's current fields, merkle_root included
inline void MineNonce(chain::Block& block) {
    for (block.nonce = 0;; ++block.nonce) {
        block.hash = block.ComputeHash();
        if (consensus::HashMeetsDifficulty(block.hash, block.difficulty)) {
            return;
        }
    }
}

// Brute-force a nonce for a block on top of `prev`
inline chain::Block SealBlock(const chain::Block& prev,
                              std::vector<chain::Transaction> txs,
                              int difficulty,
                              double timestamp = 0.0) {
    chain::Block block;
    block.index = prev.index + 1;
    block.timestamp = timestamp > 0.0 ? timestamp : prev.timestamp + 60.0;
    block.transactions = std::move(txs);
    block.previous_hash = prev.hash;
    block.difficulty = difficulty;
    block.merkle_root = consensus::ComputeMerkleRoot(block.transactions);
    MineNonce(block);
    return block;
}

/**
 * genesis + `extra` blocks, one transaction each. `tag` goes into the
 * recipient so two chains built with different tags diverge after genesis.
 */
inline std::vector<chain::Block> BuildChain(const chain::ChainParams& params,
                                            const crypto::PrivateKey& key,
                                            size_t extra,
                                            int difficulty = 1,
                                            const std::string& tag = "chain") {
    std::vector<chain::Block> blocks{params.GenesisBlock()};
    for (size_t i = 0; i < extra; ++i) {
        auto tx = MakeTransaction(key, tag + "_" + std::to_string(i), 1.0 + i,
                                  params.GenesisBlock().timestamp + 10.0 * (i + 1));
        blocks.push_back(SealBlock(blocks.back(), {tx}, difficulty));
    }
    return blocks;
}

} // namespace test
} // namespace ziacoin
