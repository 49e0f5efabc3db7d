// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ziacoin {
namespace chain {

// Persisted summary of the active chain (chain/state.json)
struct ChainStateRecord {
  int64_t height{0};
  std::string latest_block_hash;
  int difficulty{0};
};

/**
 * On-disk chain layout under the data directory:
 *
 *   chain/blocks/<hash>.json      one file per block
 *   chain/state.json              ChainStateRecord
 *   chain_backup_<name>/          snapshot copies of chain/
 *
 * Every write goes through util::atomic_write_file, so a crash leaves either
 * the old or the new file. Methods report failure through their return value
 * and log the cause; none of them throw.
 *
 * Not thread-safe; the Ledger serializes access.
 */
class ChainStorage {
public:
  explicit ChainStorage(const std::filesystem::path &datadir);

  // Creates chain/blocks if needed
  bool Initialize();

  // Returns the block hash, or nullopt if the write failed
  std::optional<std::string> SaveBlock(const Block &block);

  // nullopt if absent, unparsable, or stored under a different hash
  std::optional<Block> LoadBlock(const std::string &hash) const;

  bool HasBlock(const std::string &hash) const;

  bool SaveChainState(const ChainStateRecord &state);
  std::optional<ChainStateRecord> LoadChainState() const;
  bool HasChainState() const;

  /**
   * Rebuild the active chain by following previous_hash links back from the
   * recorded tip to genesis. Returns blocks ordered by index, or nullopt if
   * there is no state file or a linked block is missing or unreadable.
   */
  std::optional<std::vector<Block>> LoadChain() const;

  // Copy chain/ to chain_backup_<name>/. Names are limited to [A-Za-z0-9_-].
  bool Backup(const std::string &name);

  // Replace chain/ with chain_backup_<name>/. False if the backup is missing.
  bool Restore(const std::string &name);

  // Names of existing backups, oldest first
  std::vector<std::string> ListBackups() const;
  std::optional<std::string> LatestBackup() const;

  // Delete block files whose hash is not in `active`. Returns files removed.
  size_t PruneBlocks(const std::vector<Block> &active);

  const std::filesystem::path &GetChainDir() const { return chain_dir_; }

private:
  std::filesystem::path BlockPath(const std::string &hash) const;
  std::filesystem::path BackupPath(const std::string &name) const;

  std::filesystem::path datadir_;
  std::filesystem::path chain_dir_;
  std::filesystem::path blocks_dir_;
  std::filesystem::path state_file_;
};

} // namespace chain
} // namespace ziacoin
