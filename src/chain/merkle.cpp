// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/merkle.hpp"

#include "crypto/sha256.hpp"

namespace ziacoin {
namespace consensus {

std::string ComputeMerkleRoot(const std::vector<chain::Transaction> &txs) {
  if (txs.empty()) {
    return crypto::Sha256Hex("");
  }

  std::vector<std::string> level;
  level.reserve(txs.size());
  for (const auto &tx : txs) {
    level.push_back(crypto::Sha256Hex(chain::CanonicalJson(tx.ToJson())));
  }

  while (level.size() > 1) {
    if (level.size() % 2 != 0) {
      level.push_back(level.back());
    }
    std::vector<std::string> next;
    next.reserve(level.size() / 2);
    for (size_t i = 0; i < level.size(); i += 2) {
      next.push_back(crypto::Sha256Hex(level[i] + level[i + 1]));
    }
    level = std::move(next);
  }
  return level.front();
}

} // namespace consensus
} // namespace ziacoin
