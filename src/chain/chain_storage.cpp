// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chain_storage.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace ziacoin {
namespace chain {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char *kBackupPrefix = "chain_backup_";

bool IsValidBackupName(const std::string &name) {
  if (name.empty() || name.size() > 64) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  });
}

} // namespace

ChainStorage::ChainStorage(const fs::path &datadir)
    : datadir_(datadir), chain_dir_(datadir / "chain"),
      blocks_dir_(chain_dir_ / "blocks"), state_file_(chain_dir_ / "state.json") {
}

bool ChainStorage::Initialize() {
  if (!util::ensure_directory(blocks_dir_)) {
    LOG_CHAIN_ERROR("Cannot create block directory {}", blocks_dir_.string());
    return false;
  }
  return true;
}

fs::path ChainStorage::BlockPath(const std::string &hash) const {
  return blocks_dir_ / (hash + ".json");
}

fs::path ChainStorage::BackupPath(const std::string &name) const {
  return datadir_ / (std::string(kBackupPrefix) + name);
}

std::optional<std::string> ChainStorage::SaveBlock(const Block &block) {
  if (block.hash.size() != 64 || !util::IsValidHex(block.hash)) {
    LOG_CHAIN_ERROR("Refusing to store block with malformed hash '{}'",
                    block.hash);
    return std::nullopt;
  }
  try {
    if (!util::atomic_write_file(BlockPath(block.hash), block.ToJson().dump(2, ' ', true))) {
      LOG_CHAIN_ERROR("Failed to write block {} ({})", block.index,
                      block.hash.substr(0, 16));
      return std::nullopt;
    }
  } catch (const json::exception &e) {
    LOG_CHAIN_ERROR("Failed to serialize block {}: {}", block.index, e.what());
    return std::nullopt;
  }
  LOG_CHAIN_TRACE("Stored block {} ({})", block.index, block.hash.substr(0, 16));
  return block.hash;
}

std::optional<Block> ChainStorage::LoadBlock(const std::string &hash) const {
  if (hash.size() != 64 || !util::IsValidHex(hash)) {
    return std::nullopt;
  }
  const std::string content = util::read_file_string(BlockPath(hash));
  if (content.empty()) {
    return std::nullopt;
  }
  try {
    auto block = Block::FromJson(json::parse(content));
    if (!block) {
      LOG_CHAIN_ERROR("Block file {} is missing required fields",
                      hash.substr(0, 16));
      return std::nullopt;
    }
    if (block->hash != hash) {
      LOG_CHAIN_ERROR("Block file {} holds block {}", hash.substr(0, 16),
                      block->hash.substr(0, 16));
      return std::nullopt;
    }
    return block;
  } catch (const json::exception &e) {
    LOG_CHAIN_ERROR("Corrupt block file {}: {}", hash.substr(0, 16), e.what());
    return std::nullopt;
  }
}

bool ChainStorage::HasBlock(const std::string &hash) const {
  std::error_code ec;
  return util::IsValidHex(hash) && fs::exists(BlockPath(hash), ec);
}

bool ChainStorage::SaveChainState(const ChainStateRecord &state) {
  json j;
  j["height"] = state.height;
  j["latest_block_hash"] = state.latest_block_hash;
  j["difficulty"] = state.difficulty;
  if (!util::atomic_write_file(state_file_, j.dump(2))) {
    LOG_CHAIN_ERROR("Failed to write chain state to {}", state_file_.string());
    return false;
  }
  return true;
}

std::optional<ChainStateRecord> ChainStorage::LoadChainState() const {
  const std::string content = util::read_file_string(state_file_);
  if (content.empty()) {
    return std::nullopt;
  }
  try {
    json j = json::parse(content);
    ChainStateRecord state;
    state.height = j.at("height").get<int64_t>();
    state.latest_block_hash = j.at("latest_block_hash").get<std::string>();
    state.difficulty = j.at("difficulty").get<int>();
    return state;
  } catch (const json::exception &e) {
    LOG_CHAIN_ERROR("Corrupt chain state {}: {}", state_file_.string(), e.what());
    return std::nullopt;
  }
}

bool ChainStorage::HasChainState() const {
  std::error_code ec;
  return fs::exists(state_file_, ec);
}

std::optional<std::vector<Block>> ChainStorage::LoadChain() const {
  auto state = LoadChainState();
  if (!state) {
    return std::nullopt;
  }

  std::vector<Block> blocks;
  std::string next = state->latest_block_hash;
  while (true) {
    auto block = LoadBlock(next);
    if (!block) {
      LOG_CHAIN_ERROR("Chain walk stopped: block {} missing or unreadable",
                      next.substr(0, 16));
      return std::nullopt;
    }
    if (!blocks.empty() && block->index != blocks.back().index - 1) {
      LOG_CHAIN_ERROR("Chain walk stopped: block {} has index {}, expected {}",
                      next.substr(0, 16), block->index,
                      blocks.back().index - 1);
      return std::nullopt;
    }
    const bool genesis = block->index == 0;
    next = block->previous_hash;
    blocks.push_back(std::move(*block));
    if (genesis) {
      break;
    }
  }

  std::reverse(blocks.begin(), blocks.end());
  if (blocks.back().index != state->height) {
    LOG_CHAIN_WARN("Chain state height {} disagrees with tip index {}",
                   state->height, blocks.back().index);
  }
  return blocks;
}

bool ChainStorage::Backup(const std::string &name) {
  if (!IsValidBackupName(name)) {
    LOG_CHAIN_ERROR("Invalid backup name '{}'", name);
    return false;
  }
  if (!util::copy_directory(chain_dir_, BackupPath(name))) {
    LOG_CHAIN_ERROR("Failed to back up {} to {}", chain_dir_.string(),
                    BackupPath(name).string());
    return false;
  }
  LOG_CHAIN_INFO("Chain backed up as '{}'", name);
  return true;
}

bool ChainStorage::Restore(const std::string &name) {
  std::error_code ec;
  if (!IsValidBackupName(name) || !fs::is_directory(BackupPath(name), ec)) {
    LOG_CHAIN_ERROR("Backup '{}' not found", name);
    return false;
  }
  if (!util::copy_directory(BackupPath(name), chain_dir_)) {
    LOG_CHAIN_ERROR("Failed to restore backup '{}'", name);
    return false;
  }
  LOG_CHAIN_INFO("Chain restored from backup '{}'", name);
  return true;
}

std::vector<std::string> ChainStorage::ListBackups() const {
  std::vector<std::pair<fs::file_time_type, std::string>> found;
  std::error_code ec;
  const std::string prefix = kBackupPrefix;
  for (const auto &entry : fs::directory_iterator(datadir_, ec)) {
    const std::string fname = entry.path().filename().string();
    if (!entry.is_directory(ec) || fname.rfind(prefix, 0) != 0) {
      continue;
    }
    found.emplace_back(entry.last_write_time(ec), fname.substr(prefix.size()));
  }
  std::sort(found.begin(), found.end());

  std::vector<std::string> names;
  names.reserve(found.size());
  for (auto &f : found) {
    names.push_back(std::move(f.second));
  }
  return names;
}

std::optional<std::string> ChainStorage::LatestBackup() const {
  auto names = ListBackups();
  if (names.empty()) {
    return std::nullopt;
  }
  return names.back();
}

size_t ChainStorage::PruneBlocks(const std::vector<Block> &active) {
  std::unordered_set<std::string> keep;
  for (const auto &block : active) {
    keep.insert(block.hash + ".json");
  }

  std::vector<fs::path> stale;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(blocks_dir_, ec)) {
    if (keep.count(entry.path().filename().string()) == 0) {
      stale.push_back(entry.path());
    }
  }

  size_t removed = 0;
  for (const auto &path : stale) {
    if (fs::remove(path, ec)) {
      ++removed;
    }
  }
  if (removed > 0) {
    LOG_CHAIN_DEBUG("Pruned {} block files off the active chain", removed);
  }
  return removed;
}

} // namespace chain
} // namespace ziacoin
