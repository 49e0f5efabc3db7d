// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>
#include <vector>

namespace ziacoin {

namespace chain {
struct Block;
struct Transaction;
class ChainParams;
} // namespace chain

namespace validation {

/**
 * ============================================================================
 * BLOCK AND TRANSACTION VALIDATION
 * ============================================================================
 *
 * Context-free checks, used both for data arriving from peers and for the
 * chain we load from disk:
 *
 * - CheckTransaction() : amount and freshness of a gossiped transaction
 * - CheckBlock()       : hash commitment, merkle commitment, proof-of-work
 * - CheckChain()       : CheckBlock, linkage, signatures and replays over a
 *                        whole block sequence
 *
 * Checks that need ledger state (signature/duplicate acceptance into the
 * pool, orphan detection, tip linkage) live in chain::Ledger and
 * sync::SyncManager.
 * ============================================================================
 */

/**
 * Validation state - tracks why validation failed
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID, // Rejected data
    ERROR    // Local failure (I/O, storage)
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }
  bool IsError() const { return result_ == Result::ERROR; }

  bool Invalid(const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(const std::string &reject_reason,
             const std::string &debug_message = "") {
    result_ = Result::ERROR;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  const std::string &GetRejectReason() const { return reject_reason_; }
  const std::string &GetDebugMessage() const { return debug_message_; }

  std::string ToString() const {
    if (IsValid()) {
      return "valid";
    }
    return debug_message_.empty() ? reject_reason_
                                  : reject_reason_ + " (" + debug_message_ + ")";
  }

private:
  Result result_;
  std::string reject_reason_;
  std::string debug_message_;
};

// Reject reasons shared between modules and tests
namespace reject {
constexpr const char *INVALID_SIGNATURE = "invalid-signature";
constexpr const char *DUPLICATE_TX = "duplicate-transaction";
constexpr const char *BAD_AMOUNT = "bad-amount";
constexpr const char *STALE_TX = "stale-timestamp";
constexpr const char *BAD_HASH = "bad-hash";
constexpr const char *BAD_MERKLE = "bad-merkle-root";
constexpr const char *HIGH_HASH = "high-hash";
constexpr const char *BAD_DIFFICULTY = "bad-difficulty";
constexpr const char *BAD_PREV = "bad-prevblk";
constexpr const char *ORPHAN = "orphan-block";
constexpr const char *DUPLICATE_BLOCK = "duplicate-block";
constexpr const char *BAD_INDEX = "bad-index";
constexpr const char *BAD_TX = "bad-tx-signature";
constexpr const char *BAD_GENESIS = "bad-genesis";
constexpr const char *SHORT_CHAIN = "chain-not-longer";
constexpr const char *STORAGE = "storage-failure";
} // namespace reject

/**
 * Transaction acceptance from the network.
 *   amount > 0
 *   |now - timestamp| <= params.nMaxTxAge   (now = util::GetTimeSeconds())
 * The signature is checked later by Ledger::AddTransaction.
 */
bool CheckTransaction(const chain::Transaction &tx,
                      const chain::ChainParams &params,
                      ValidationState &state);

/**
 * Context-free block checks:
 *   stored hash == recomputed hash
 *   merkle_root == commitment of the transaction list
 *   non-genesis: difficulty >= 1 and hash meets it
 */
bool CheckBlock(const chain::Block &block, ValidationState &state);

/**
 * Whole-chain walk from index 1: every block passes CheckBlock, every
 * previous_hash equals the predecessor's hash, every transaction verifies
 * and no signature appears twice. Stops at the first failure.
 */
bool CheckChain(const std::vector<chain::Block> &blocks,
                ValidationState &state);

} // namespace validation
} // namespace ziacoin
