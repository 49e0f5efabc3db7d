// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/pow.hpp"

#include <algorithm>

namespace ziacoin {
namespace consensus {

bool HashMeetsDifficulty(const std::string &hash, int difficulty) {
  if (difficulty <= 0) {
    return true;
  }
  if (hash.size() < static_cast<size_t>(difficulty)) {
    return false;
  }
  return std::all_of(hash.begin(), hash.begin() + difficulty,
                     [](char c) { return c == '0'; });
}

int AdjustDifficulty(int difficulty, double elapsed_seconds,
                     double target_block_time) {
  if (elapsed_seconds < target_block_time / 2) {
    return difficulty + 1;
  }
  if (elapsed_seconds > target_block_time * 2) {
    return std::max(MIN_DIFFICULTY, difficulty - 1);
  }
  return difficulty;
}

} // namespace consensus
} // namespace ziacoin
