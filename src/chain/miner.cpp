// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/miner.hpp"

#include "chain/chainparams.hpp"
#include "chain/ledger.hpp"
#include "chain/merkle.hpp"
#include "chain/pow.hpp"
#include "chain/validation.hpp"
#include "crypto/sha256.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"

#include <stdexcept>

namespace ziacoin {
namespace mining {

namespace {

constexpr auto kIdlePoll = std::chrono::milliseconds(500);
constexpr uint64_t kHashCounterBatch = 1024;

bool DigestMeetsDifficulty(const crypto::Sha256Digest &digest, int difficulty) {
  if (difficulty > static_cast<int>(digest.size() * 2)) {
    return false;
  }
  for (int i = 0; i < difficulty; ++i) {
    const uint8_t byte = digest[i / 2];
    const uint8_t nibble = (i % 2 == 0) ? (byte >> 4) : (byte & 0x0f);
    if (nibble != 0) {
      return false;
    }
  }
  return true;
}

} // namespace

MiningEngine::MiningEngine(chain::Ledger &ledger,
                           const chain::ChainParams &params)
    : ledger_(ledger), params_(params) {}

MiningEngine::~MiningEngine() { Stop(); }

const char *MiningEngine::StateName(State state) {
  switch (state) {
  case State::Idle:
    return "idle";
  case State::Assembling:
    return "assembling";
  case State::Searching:
    return "searching";
  case State::Sealed:
    return "sealed";
  }
  return "unknown";
}

bool MiningEngine::Start() {
  bool expected = false;
  if (!mining_.compare_exchange_strong(expected, true)) {
    LOG_CHAIN_WARN("Miner: already mining");
    return false;
  }

  std::lock_guard<std::mutex> lock(stop_mutex_);
  if (worker_.joinable()) {
    worker_.join();
  }

  stopping_.store(false);
  {
    std::lock_guard<std::mutex> time_lock(time_mutex_);
    start_time_ = std::chrono::steady_clock::now();
  }
  total_hashes_.store(0);

  LOG_CHAIN_INFO("Miner: starting (chain: {}, difficulty: {})",
                 params_.GetChainTypeString(), ledger_.GetDifficulty());
  worker_ = std::thread([this]() { MiningWorker(); });
  return true;
}

void MiningEngine::Stop() {
  mining_.store(false);
  stopping_.store(true);
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    wake_pending_ = true;
  }
  wake_cv_.notify_all();

  std::lock_guard<std::mutex> lock(stop_mutex_);
  if (worker_.joinable()) {
    worker_.join();
    LOG_CHAIN_INFO("Miner: stopped (hashes: {}, blocks found: {})",
                   total_hashes_.load(), blocks_found_.load());
  }
  stopping_.store(false);
}

void MiningEngine::NotifyNewTransaction() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    wake_pending_ = true;
  }
  wake_cv_.notify_all();
}

void MiningEngine::SetBlockFoundCallback(BlockFoundCallback cb) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  on_block_found_ = std::move(cb);
}

double MiningEngine::GetHashrate() const {
  if (!mining_.load()) {
    return 0.0;
  }
  double elapsed;
  {
    std::lock_guard<std::mutex> lock(time_mutex_);
    elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                            start_time_)
                  .count();
  }
  if (elapsed <= 0.0) {
    return 0.0;
  }
  return static_cast<double>(total_hashes_.load()) / elapsed;
}

void MiningEngine::MiningWorker() {
  while (mining_.load()) {
    if (ledger_.GetPendingCount() == 0) {
      std::unique_lock<std::mutex> lock(wake_mutex_);
      wake_cv_.wait_for(lock, kIdlePoll,
                        [this] { return wake_pending_ || !mining_.load(); });
      wake_pending_ = false;
      continue;
    }

    try {
      MinePendingTransactions();
    } catch (const std::exception &e) {
      LOG_CHAIN_ERROR("Miner: fatal error, stopping: {}", e.what());
      mining_.store(false);
    }
  }
}

std::optional<chain::Block> MiningEngine::MinePendingTransactions() {
  std::lock_guard<std::mutex> attempt_lock(attempt_mutex_);
  interrupt_.store(false);

  // Assembling
  state_.store(State::Assembling);
  std::vector<chain::Transaction> txs = ledger_.DrainPending();
  if (txs.empty()) {
    state_.store(State::Idle);
    return std::nullopt;
  }
  const auto assembling_started = std::chrono::steady_clock::now();

  const chain::Block tip = ledger_.GetTip();
  chain::Block candidate;
  candidate.index = tip.index + 1;
  candidate.timestamp = util::GetTimeSeconds();
  candidate.transactions = std::move(txs);
  candidate.previous_hash = tip.hash;
  candidate.nonce = 0;
  candidate.difficulty = ledger_.GetDifficulty();

  bool found = false;
  try {
    candidate.merkle_root = consensus::ComputeMerkleRoot(candidate.transactions);

    LOG_CHAIN_DEBUG("Miner: mining block {} with {} txs at difficulty {}",
                    candidate.index, candidate.transactions.size(),
                    candidate.difficulty);

    // Searching
    state_.store(State::Searching);
    found = SearchNonce(candidate);
  } catch (...) {
    ledger_.ReturnPending(std::move(candidate.transactions));
    state_.store(State::Idle);
    throw;
  }

  if (!found) {
    LOG_CHAIN_DEBUG("Miner: attempt for block {} cancelled", candidate.index);
    ledger_.ReturnPending(std::move(candidate.transactions));
    state_.store(State::Idle);
    return std::nullopt;
  }

  // Sealed
  state_.store(State::Sealed);
  validation::ValidationState state;
  if (!ledger_.AppendBlock(candidate, state)) {
    LOG_CHAIN_WARN("Miner: block {} not appended: {}", candidate.index,
                   state.ToString());
    ledger_.ReturnPending(std::move(candidate.transactions));
    state_.store(State::Idle);
    return std::nullopt;
  }

  const double elapsed = std::chrono::duration<double>(
                             std::chrono::steady_clock::now() -
                             assembling_started)
                             .count();
  if (!params_.GetConsensus().fPowNoRetargeting) {
    const int next = consensus::AdjustDifficulty(
        candidate.difficulty, elapsed,
        params_.GetConsensus().nTargetBlockTime);
    if (next != candidate.difficulty) {
      LOG_CHAIN_INFO("Miner: difficulty {} -> {} (block took {:.2f}s)",
                     candidate.difficulty, next, elapsed);
    }
    ledger_.SetDifficulty(next);
  }

  blocks_found_.fetch_add(1);
  LOG_CHAIN_INFO("Miner: found block {} hash={} nonce={} in {:.2f}s",
                 candidate.index, candidate.hash.substr(0, 16),
                 candidate.nonce, elapsed);

  BlockFoundCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = on_block_found_;
  }
  if (cb) {
    cb(candidate);
  }

  state_.store(State::Idle);
  return candidate;
}

bool MiningEngine::SearchNonce(chain::Block &candidate) {
  // The canonical preimage renders keys in sorted order, so "nonce" sits
  // between "merkle_root" and "previous_hash". Split it there once and only
  // re-render the nonce digits per attempt.
  candidate.nonce = 0;
  const std::string preimage = candidate.HashPreimage();
  const std::string marker = "\"nonce\":0,\"previous_hash\":";
  const size_t pos = preimage.find(marker);
  if (pos == std::string::npos) {
    throw std::runtime_error("mining: nonce field not found in block preimage");
  }
  const std::string prefix = preimage.substr(0, pos + 8); // up to "nonce":
  const std::string suffix = preimage.substr(pos + 9);    // from ,"previous_hash"

  std::string buffer;
  buffer.reserve(preimage.size() + 20);
  uint64_t batch = 0;

  for (uint64_t nonce = 0;; ++nonce) {
    if (Cancelled()) {
      total_hashes_.fetch_add(batch);
      return false;
    }

    buffer.assign(prefix);
    buffer.append(std::to_string(nonce));
    buffer.append(suffix);
    const crypto::Sha256Digest digest = crypto::Sha256(buffer);

    if (++batch == kHashCounterBatch) {
      total_hashes_.fetch_add(batch);
      batch = 0;
    }

    if (DigestMeetsDifficulty(digest, candidate.difficulty)) {
      total_hashes_.fetch_add(batch);
      candidate.nonce = nonce;
      candidate.hash = util::HexStr(digest.data(), digest.size());
      return true;
    }
  }
}

} // namespace mining
} // namespace ziacoin
