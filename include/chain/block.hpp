// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/transaction.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ziacoin {
namespace chain {

/**
 * A block of the ledger.
 *
 * `hash` commits to every other field through ComputeHash(); it is filled in
 * once by the miner (or by the genesis builder) and never changes afterwards.
 */
struct Block {
  int64_t index{0};
  double timestamp{0.0};
  std::vector<Transaction> transactions;
  std::string previous_hash;
  uint64_t nonce{0};
  int difficulty{0};
  std::string merkle_root;
  std::string hash;

  // Canonical JSON of all fields except `hash`
  std::string HashPreimage() const;

  // SHA-256 hex of HashPreimage()
  std::string ComputeHash() const;

  bool IsGenesis() const { return index == 0; }

  nlohmann::json ToJson() const;

  // nullopt if any of index, timestamp, transactions, previous_hash, nonce,
  // hash, difficulty or merkle_root is missing or mistyped.
  static std::optional<Block> FromJson(const nlohmann::json &j);

  std::string ToString() const;
};

} // namespace chain
} // namespace ziacoin
