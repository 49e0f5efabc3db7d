// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace ziacoin {
namespace consensus {

// Difficulty never drops below this
constexpr int MIN_DIFFICULTY = 1;

// True if `hash` starts with at least `difficulty` '0' hex characters.
// A difficulty of 0 or less is satisfied by any hash.
bool HashMeetsDifficulty(const std::string &hash, int difficulty);

/**
 * Next difficulty after a block that took `elapsed_seconds` to find.
 *
 *   elapsed < target / 2  ->  difficulty + 1
 *   elapsed > target * 2  ->  max(MIN_DIFFICULTY, difficulty - 1)
 *   otherwise             ->  unchanged
 */
int AdjustDifficulty(int difficulty, double elapsed_seconds,
                     double target_block_time);

} // namespace consensus
} // namespace ziacoin
