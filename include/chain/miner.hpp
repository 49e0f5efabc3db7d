// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace ziacoin {

namespace chain {
class ChainParams;
class Ledger;
} // namespace chain

namespace mining {

/**
 * Proof-of-work block producer.
 *
 * Each attempt walks Idle -> Assembling -> Searching -> Sealed -> Idle:
 *   Assembling  drain the pool, build the candidate on top of the tip
 *   Searching   try nonces until the hash meets the difficulty
 *   Sealed      append through the Ledger, retarget, notify listeners
 *
 * MinePendingTransactions() runs a single attempt on the calling thread;
 * Start()/Stop() run attempts continuously on a worker thread whenever the
 * pool is non-empty. Attempts are serialized. A cancelled or failed attempt
 * hands its transactions back to the pool.
 */
class MiningEngine {
public:
  enum class State { Idle, Assembling, Searching, Sealed };

  using BlockFoundCallback = std::function<void(const chain::Block &)>;

  MiningEngine(chain::Ledger &ledger, const chain::ChainParams &params);
  ~MiningEngine();

  MiningEngine(const MiningEngine &) = delete;
  MiningEngine &operator=(const MiningEngine &) = delete;

  bool Start();
  void Stop();
  bool IsMining() const { return mining_.load(); }

  /**
   * One mining attempt.
   * @return the sealed block, or nullopt if the pool was empty, the search
   *         was cancelled, or the tip moved before the block could be
   *         appended
   * @throws std::runtime_error if hashing fails
   */
  std::optional<chain::Block> MinePendingTransactions();

  // Cancel the attempt in flight (if any); checked once per nonce
  void Interrupt() { interrupt_.store(true); }

  // Wake the worker when the pool gains a transaction
  void NotifyNewTransaction();

  void SetBlockFoundCallback(BlockFoundCallback cb);

  State GetState() const { return state_.load(); }
  static const char *StateName(State state);

  double GetHashrate() const;
  uint64_t GetTotalHashes() const { return total_hashes_.load(); }
  int GetBlocksFound() const { return blocks_found_.load(); }

private:
  void MiningWorker();

  // Returns false if cancelled before a solution was found
  bool SearchNonce(chain::Block &candidate);

  bool Cancelled() const { return interrupt_.load() || stopping_.load(); }

  chain::Ledger &ledger_;
  const chain::ChainParams &params_;

  std::atomic<State> state_{State::Idle};
  std::atomic<bool> mining_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<bool> interrupt_{false};
  std::atomic<uint64_t> total_hashes_{0};
  std::atomic<int> blocks_found_{0};

  std::chrono::steady_clock::time_point start_time_;
  mutable std::mutex time_mutex_;

  std::mutex attempt_mutex_; // One attempt at a time

  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  bool wake_pending_{false};

  std::mutex callback_mutex_;
  BlockFoundCallback on_block_found_;

  std::thread worker_;
  std::mutex stop_mutex_; // Serializes Stop()
};

} // namespace mining
} // namespace ziacoin
