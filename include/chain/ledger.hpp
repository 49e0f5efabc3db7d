// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/chain_storage.hpp"
#include "chain/transaction.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ziacoin {

namespace validation {
class ValidationState;
}

namespace chain {

class ChainParams;

// Thrown when the chain is invalid and no backup can restore a valid one.
// The node cannot continue safely.
class RecoveryFailed : public std::runtime_error {
public:
  explicit RecoveryFailed(const std::string &what)
      : std::runtime_error("chain recovery failed: " + what) {}
};

/**
 * Ledger - the block sequence and the pending transaction pool.
 *
 * Invariants:
 * - chain_[0] is the genesis block of params_, chain_[i].index == i
 * - chain_[i].previous_hash == chain_[i-1].hash
 * - the pool holds no two transactions with the same signature and no
 *   transaction already confirmed in chain_
 *
 * Thread-safety: one shared_mutex. Mutations take it exclusively, queries
 * take it shared and return copies. Signature verification happens before
 * the lock is taken.
 */
class Ledger {
public:
  Ledger(const ChainParams &params, const std::filesystem::path &datadir);

  Ledger(const Ledger &) = delete;
  Ledger &operator=(const Ledger &) = delete;

  /**
   * Load the stored chain, or create and persist genesis on first run.
   * A stored chain that fails validation is recovered from the latest
   * backup. Returns false if the storage directory cannot be created.
   * Throws RecoveryFailed if recovery is needed and fails.
   */
  bool Initialize();

  /**
   * Accept a signed transaction into the pool.
   * Rejects "invalid-signature" (signature missing or not by sender) and
   * "duplicate-transaction" (already pending or confirmed); the pool is left
   * unchanged on rejection.
   * @return index of the block that will include it
   */
  std::optional<int64_t> AddTransaction(const Transaction &tx,
                                        validation::ValidationState &state);

  // Hash recompute, linkage and signatures over the whole chain
  bool IsChainValid() const;

  // Sum received minus sum sent over every confirmed transaction
  double GetBalance(const std::string &address) const;

  /**
   * No-op while the chain is valid. Otherwise restore the most recent backup,
   * reload and revalidate, then adopt it. Exactly one backup is tried.
   * Throws RecoveryFailed if there is no backup or the restored chain is
   * unusable; the in-memory chain is unchanged in that case.
   */
  void RecoverChain();

  // Take every pending transaction (pool becomes empty)
  std::vector<Transaction> DrainPending();

  // Put back transactions from an abandoned attempt. Ones that were confirmed
  // or re-added in the meantime are dropped.
  void ReturnPending(std::vector<Transaction> txs);

  /**
   * Append a block on top of the current tip and persist it.
   * Rejects blocks that don't link to the tip, fail CheckBlock, carry a
   * transaction with a bad signature, or repeat a confirmed transaction.
   * Pool entries confirmed by the block are removed.
   */
  bool AppendBlock(const Block &block, validation::ValidationState &state);

  /**
   * Replace the whole chain with `candidate` if it is strictly longer, starts
   * at our genesis, has contiguous indexes, meets each block's declared
   * difficulty and passes CheckChain. Length is the only fork-choice rule.
   */
  bool ReplaceChain(const std::vector<Block> &candidate,
                    validation::ValidationState &state);

  Block GetTip() const;
  int64_t GetHeight() const;
  size_t GetChainLength() const;
  std::vector<Block> GetChain() const;

  // Blocks with index in [start, end], clamped to [0, height]
  std::vector<Block> GetBlocks(int64_t start, int64_t end) const;

  std::optional<Block> GetBlockByHash(const std::string &hash) const;
  bool HasBlock(const std::string &hash) const;

  std::vector<Transaction> GetPending() const;
  size_t GetPendingCount() const;

  int GetDifficulty() const;
  void SetDifficulty(int difficulty);

  // Persist chain state (tip, height, difficulty)
  bool Flush();

  // Flush, then snapshot chain storage as chain_backup_<name>
  bool Backup(const std::string &name);

  const ChainParams &GetParams() const { return params_; }

private:
  // All *Locked helpers expect mutex_ held exclusively
  void AdoptChainLocked(std::vector<Block> blocks, int difficulty);
  bool PersistStateLocked();
  void RestoreFromBackupLocked();

  const ChainParams &params_;
  ChainStorage storage_;

  mutable std::shared_mutex mutex_;
  std::vector<Block> chain_;
  std::unordered_map<std::string, size_t> index_by_hash_;
  std::unordered_set<std::string> confirmed_sigs_;
  std::vector<Transaction> pending_;
  std::unordered_set<std::string> pending_sigs_;
  int difficulty_;
};

} // namespace chain
} // namespace ziacoin
