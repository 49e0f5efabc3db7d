// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/transaction.hpp"

#include <string>
#include <vector>

namespace ziacoin {
namespace consensus {

/**
 * Merkle commitment over an ordered transaction list.
 *
 * Leaves are SHA-256 hex digests of each transaction's canonical JSON. Each
 * level hashes the concatenated hex strings of adjacent pairs, duplicating the
 * last entry of an odd-sized level. The empty list commits to sha256("").
 */
std::string ComputeMerkleRoot(const std::vector<chain::Transaction> &txs);

} // namespace consensus
} // namespace ziacoin
