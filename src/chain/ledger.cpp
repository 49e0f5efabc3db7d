// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/ledger.hpp"

#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include "chain/validation.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace ziacoin {
namespace chain {

using validation::ValidationState;
namespace reject = validation::reject;

Ledger::Ledger(const ChainParams &params, const std::filesystem::path &datadir)
    : params_(params), storage_(datadir),
      difficulty_(params.GetConsensus().nInitialDifficulty) {
  AdoptChainLocked({params_.GenesisBlock()}, difficulty_);
}

bool Ledger::Initialize() {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (!storage_.Initialize()) {
    return false;
  }

  const Block &genesis = params_.GenesisBlock();

  if (!storage_.HasChainState()) {
    LOG_CHAIN_INFO("No stored chain, starting from genesis {}",
                   genesis.hash.substr(0, 16));
    if (!storage_.SaveBlock(genesis)) {
      return false;
    }
    AdoptChainLocked({genesis}, params_.GetConsensus().nInitialDifficulty);
    return PersistStateLocked();
  }

  auto loaded = storage_.LoadChain();
  auto state = storage_.LoadChainState();
  ValidationState vstate;
  if (loaded && !loaded->empty() && loaded->front().hash == genesis.hash &&
      validation::CheckChain(*loaded, vstate)) {
    const int difficulty =
        std::max(consensus::MIN_DIFFICULTY,
                 state ? state->difficulty
                       : params_.GetConsensus().nInitialDifficulty);
    AdoptChainLocked(std::move(*loaded), difficulty);
    LOG_CHAIN_INFO("Loaded chain: height={} tip={} difficulty={}",
                   chain_.back().index, chain_.back().hash.substr(0, 16),
                   difficulty_);
    return true;
  }

  LOG_CHAIN_ERROR("Stored chain is unusable ({}), attempting recovery",
                  loaded ? vstate.ToString() : "unreadable");
  RestoreFromBackupLocked();
  return true;
}

std::optional<int64_t> Ledger::AddTransaction(const Transaction &tx,
                                              ValidationState &state) {
  if (!tx.Verify()) {
    state.Invalid(reject::INVALID_SIGNATURE,
                  "sender " + tx.sender.substr(0, 16));
    return std::nullopt;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  const std::string &sig = *tx.signature;
  if (pending_sigs_.count(sig) || confirmed_sigs_.count(sig)) {
    state.Invalid(reject::DUPLICATE_TX);
    return std::nullopt;
  }
  pending_.push_back(tx);
  pending_sigs_.insert(sig);
  LOG_CHAIN_DEBUG("Accepted transaction {} -> {} amount={} (pool size {})",
                  tx.sender.substr(0, 16), tx.recipient, tx.amount,
                  pending_.size());
  return chain_.back().index + 1;
}

bool Ledger::IsChainValid() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  ValidationState state;
  if (!validation::CheckChain(chain_, state)) {
    LOG_CHAIN_WARN("Chain validation failed: {}", state.ToString());
    return false;
  }
  return true;
}

double Ledger::GetBalance(const std::string &address) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  double balance = 0.0;
  for (const auto &block : chain_) {
    for (const auto &tx : block.transactions) {
      if (tx.sender == address) {
        balance -= tx.amount;
      }
      if (tx.recipient == address) {
        balance += tx.amount;
      }
    }
  }
  return balance;
}

void Ledger::RecoverChain() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  ValidationState state;
  if (validation::CheckChain(chain_, state)) {
    LOG_CHAIN_DEBUG("RecoverChain: chain is valid, nothing to do");
    return;
  }
  LOG_CHAIN_WARN("RecoverChain: chain invalid ({})", state.ToString());
  RestoreFromBackupLocked();
}

void Ledger::RestoreFromBackupLocked() {
  auto name = storage_.LatestBackup();
  if (!name) {
    throw RecoveryFailed("no backup available");
  }
  if (!storage_.Restore(*name)) {
    throw RecoveryFailed("could not restore backup '" + *name + "'");
  }

  auto restored = storage_.LoadChain();
  if (!restored || restored->empty()) {
    throw RecoveryFailed("backup '" + *name + "' holds no readable chain");
  }
  if (restored->front().hash != params_.GenesisBlock().hash) {
    throw RecoveryFailed("backup '" + *name + "' has a foreign genesis");
  }
  ValidationState state;
  if (!validation::CheckChain(*restored, state)) {
    throw RecoveryFailed("backup '" + *name + "' is invalid: " +
                         state.ToString());
  }

  auto record = storage_.LoadChainState();
  const int difficulty =
      std::max(consensus::MIN_DIFFICULTY,
               record ? record->difficulty
                      : params_.GetConsensus().nInitialDifficulty);
  AdoptChainLocked(std::move(*restored), difficulty);
  LOG_CHAIN_INFO("Recovered chain from backup '{}': height={}", *name,
                 chain_.back().index);
}

std::vector<Transaction> Ledger::DrainPending() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::vector<Transaction> drained;
  drained.swap(pending_);
  pending_sigs_.clear();
  return drained;
}

void Ledger::ReturnPending(std::vector<Transaction> txs) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::vector<Transaction> restored;
  for (auto &tx : txs) {
    if (!tx.signature) {
      continue;
    }
    const std::string &sig = *tx.signature;
    if (confirmed_sigs_.count(sig) || pending_sigs_.count(sig)) {
      continue;
    }
    pending_sigs_.insert(sig);
    restored.push_back(std::move(tx));
  }
  // Returned transactions are older than anything added meanwhile
  restored.insert(restored.end(), std::make_move_iterator(pending_.begin()),
                  std::make_move_iterator(pending_.end()));
  pending_.swap(restored);
}

bool Ledger::AppendBlock(const Block &block, ValidationState &state) {
  if (!validation::CheckBlock(block, state)) {
    return false;
  }
  for (const auto &tx : block.transactions) {
    if (!tx.Verify()) {
      return state.Invalid(reject::BAD_TX);
    }
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  const Block &tip = chain_.back();
  if (block.previous_hash != tip.hash) {
    return state.Invalid(reject::BAD_PREV,
                         "tip is " + tip.hash.substr(0, 16));
  }
  if (block.index != tip.index + 1) {
    return state.Invalid(reject::BAD_INDEX,
                         "expected " + std::to_string(tip.index + 1) +
                             ", got " + std::to_string(block.index));
  }
  std::unordered_set<std::string> block_sigs;
  for (const auto &tx : block.transactions) {
    if (confirmed_sigs_.count(*tx.signature)) {
      return state.Invalid(reject::DUPLICATE_TX, "already confirmed");
    }
    if (!block_sigs.insert(*tx.signature).second) {
      return state.Invalid(reject::DUPLICATE_TX, "repeated within block");
    }
  }

  // Disk first: a failed write leaves the in-memory chain untouched
  if (!storage_.SaveBlock(block)) {
    return state.Error(reject::STORAGE, "could not write block");
  }
  if (!storage_.SaveChainState({block.index, block.hash, difficulty_})) {
    return state.Error(reject::STORAGE, "could not write chain state");
  }

  chain_.push_back(block);
  index_by_hash_[block.hash] = chain_.size() - 1;
  for (const auto &tx : block.transactions) {
    confirmed_sigs_.insert(*tx.signature);
    pending_sigs_.erase(*tx.signature);
  }
  pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                [this](const Transaction &tx) {
                                  return confirmed_sigs_.count(*tx.signature) >
                                         0;
                                }),
                 pending_.end());

  LOG_CHAIN_INFO("New tip: height={} hash={} txs={}", block.index,
                 block.hash.substr(0, 16), block.transactions.size());
  return true;
}

bool Ledger::ReplaceChain(const std::vector<Block> &candidate,
                          ValidationState &state) {
  if (candidate.empty()) {
    return state.Invalid(reject::SHORT_CHAIN, "empty candidate");
  }
  if (candidate.size() <= GetChainLength()) {
    return state.Invalid(reject::SHORT_CHAIN,
                         "candidate length " +
                             std::to_string(candidate.size()));
  }
  if (candidate.front().hash != params_.GenesisBlock().hash) {
    return state.Invalid(reject::BAD_GENESIS);
  }
  for (size_t i = 0; i < candidate.size(); ++i) {
    const Block &block = candidate[i];
    if (block.index != static_cast<int64_t>(i)) {
      return state.Invalid(reject::BAD_INDEX,
                           "position " + std::to_string(i));
    }
  }
  // Per-block checks, linkage, signatures and replayed transactions
  if (!validation::CheckChain(candidate, state)) {
    return false;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  // The tip may have grown while we were validating
  if (candidate.size() <= chain_.size()) {
    return state.Invalid(reject::SHORT_CHAIN, "local chain grew");
  }

  for (const auto &block : candidate) {
    if (!storage_.HasBlock(block.hash) && !storage_.SaveBlock(block)) {
      return state.Error(reject::STORAGE, "could not write block");
    }
  }

  const Block &new_tip = candidate.back();
  if (!storage_.SaveChainState({new_tip.index, new_tip.hash, difficulty_})) {
    return state.Error(reject::STORAGE, "could not write chain state");
  }

  const size_t old_length = chain_.size();
  AdoptChainLocked(candidate, difficulty_);
  storage_.PruneBlocks(chain_);

  LOG_CHAIN_INFO("Replaced chain: length {} -> {}, tip={}", old_length,
                 chain_.size(), chain_.back().hash.substr(0, 16));
  return true;
}

void Ledger::AdoptChainLocked(std::vector<Block> blocks, int difficulty) {
  chain_ = std::move(blocks);
  difficulty_ = difficulty;

  index_by_hash_.clear();
  confirmed_sigs_.clear();
  for (size_t i = 0; i < chain_.size(); ++i) {
    index_by_hash_[chain_[i].hash] = i;
    for (const auto &tx : chain_[i].transactions) {
      if (tx.signature) {
        confirmed_sigs_.insert(*tx.signature);
      }
    }
  }

  std::vector<Transaction> still_pending;
  pending_sigs_.clear();
  for (auto &tx : pending_) {
    if (confirmed_sigs_.count(*tx.signature) == 0 &&
        pending_sigs_.insert(*tx.signature).second) {
      still_pending.push_back(std::move(tx));
    }
  }
  pending_.swap(still_pending);
}

bool Ledger::PersistStateLocked() {
  ChainStateRecord record;
  record.height = chain_.back().index;
  record.latest_block_hash = chain_.back().hash;
  record.difficulty = difficulty_;
  return storage_.SaveChainState(record);
}

Block Ledger::GetTip() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chain_.back();
}

int64_t Ledger::GetHeight() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chain_.back().index;
}

size_t Ledger::GetChainLength() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chain_.size();
}

std::vector<Block> Ledger::GetChain() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chain_;
}

std::vector<Block> Ledger::GetBlocks(int64_t start, int64_t end) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const int64_t height = chain_.back().index;
  start = std::max<int64_t>(start, 0);
  end = std::min(end, height);
  if (start > end) {
    return {};
  }
  return std::vector<Block>(chain_.begin() + start, chain_.begin() + end + 1);
}

std::optional<Block> Ledger::GetBlockByHash(const std::string &hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = index_by_hash_.find(hash);
  if (it == index_by_hash_.end()) {
    return std::nullopt;
  }
  return chain_[it->second];
}

bool Ledger::HasBlock(const std::string &hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return index_by_hash_.count(hash) > 0;
}

std::vector<Transaction> Ledger::GetPending() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return pending_;
}

size_t Ledger::GetPendingCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return pending_.size();
}

int Ledger::GetDifficulty() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return difficulty_;
}

void Ledger::SetDifficulty(int difficulty) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  difficulty_ = std::max(consensus::MIN_DIFFICULTY, difficulty);
}

bool Ledger::Flush() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return PersistStateLocked();
}

bool Ledger::Backup(const std::string &name) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (!PersistStateLocked()) {
    return false;
  }
  return storage_.Backup(name);
}

} // namespace chain
} // namespace ziacoin
