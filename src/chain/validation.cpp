// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/validation.hpp"

#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "chain/merkle.hpp"
#include "chain/pow.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

#include <cmath>
#include <string>
#include <unordered_set>

namespace ziacoin {
namespace validation {

bool CheckTransaction(const chain::Transaction &tx,
                      const chain::ChainParams &params,
                      ValidationState &state) {
  if (!(tx.amount > 0) || !std::isfinite(tx.amount)) {
    return state.Invalid(reject::BAD_AMOUNT,
                         "amount " + std::to_string(tx.amount));
  }

  const double now = util::GetTimeSeconds();
  const double age = std::fabs(now - tx.timestamp);
  if (!(age <= static_cast<double>(params.GetConsensus().nMaxTxAge))) {
    return state.Invalid(reject::STALE_TX,
                         "timestamp is " + std::to_string(age) +
                             "s away from local time");
  }
  return true;
}

bool CheckBlock(const chain::Block &block, ValidationState &state) {
  const std::string computed = block.ComputeHash();
  if (computed != block.hash) {
    return state.Invalid(reject::BAD_HASH, "computed " + computed);
  }

  if (consensus::ComputeMerkleRoot(block.transactions) != block.merkle_root) {
    return state.Invalid(reject::BAD_MERKLE);
  }

  if (!block.IsGenesis()) {
    if (block.difficulty < consensus::MIN_DIFFICULTY) {
      return state.Invalid(reject::BAD_DIFFICULTY,
                           "difficulty " + std::to_string(block.difficulty));
    }
    if (!consensus::HashMeetsDifficulty(block.hash, block.difficulty)) {
      return state.Invalid(reject::HIGH_HASH,
                           "hash does not meet difficulty " +
                               std::to_string(block.difficulty));
    }
  }
  return true;
}

bool CheckChain(const std::vector<chain::Block> &blocks,
                ValidationState &state) {
  std::unordered_set<std::string> seen_sigs;
  for (size_t i = 1; i < blocks.size(); ++i) {
    const chain::Block &current = blocks[i];
    const chain::Block &previous = blocks[i - 1];

    // Hash, merkle commitment and proof-of-work, as for a single block
    if (!CheckBlock(current, state)) {
      LOG_CHAIN_DEBUG("CheckChain: block {} rejected: {}", current.index,
                      state.ToString());
      return false;
    }
    if (current.previous_hash != previous.hash) {
      LOG_CHAIN_DEBUG("CheckChain: broken link at index {}", current.index);
      return state.Invalid(reject::BAD_PREV,
                           "at index " + std::to_string(current.index));
    }
    for (const auto &tx : current.transactions) {
      if (!tx.Verify()) {
        LOG_CHAIN_DEBUG("CheckChain: bad signature in block {}",
                        current.index);
        return state.Invalid(reject::BAD_TX,
                             "in block " + std::to_string(current.index));
      }
      if (!seen_sigs.insert(*tx.signature).second) {
        LOG_CHAIN_DEBUG("CheckChain: transaction replayed in block {}",
                        current.index);
        return state.Invalid(reject::DUPLICATE_TX,
                             "in block " + std::to_string(current.index));
      }
    }
  }
  return true;
}

} // namespace validation
} // namespace ziacoin
