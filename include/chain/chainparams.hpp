// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ziacoin {
namespace chain {

enum class ChainType {
  MAIN,    // Production network
  TESTNET, // Public test network
  REGTEST  // Local testing, no retargeting
};

struct ConsensusParams {
  int nInitialDifficulty;      // Leading hex zeros required after genesis
  double nTargetBlockTime;     // Seconds between blocks the retarget aims for
  bool fPowNoRetargeting;      // Keep difficulty fixed (regtest)
  int64_t nMaxTxAge;           // Max |now - tx.timestamp| accepted, seconds
  double nGenesisTime;         // Fixed so every node derives the same genesis
};

/**
 * Per-network parameters.
 *
 * Instances are built once by the factory methods and passed by const
 * reference to every component that needs them.
 */
class ChainParams {
public:
  ChainParams() = default;
  virtual ~ChainParams() = default;

  const ConsensusParams &GetConsensus() const { return consensus; }
  uint16_t GetDefaultPort() const { return nDefaultPort; }
  const Block &GenesisBlock() const { return genesis; }
  ChainType GetChainType() const { return chainType; }
  std::string GetChainTypeString() const;
  const std::vector<std::string> &FixedSeeds() const { return vFixedSeeds; }

  // Command line / config overrides
  void SetInitialDifficulty(int difficulty);
  void SetTargetBlockTime(double seconds) {
    consensus.nTargetBlockTime = seconds;
  }
  void SetRetargeting(bool enabled) { consensus.fPowNoRetargeting = !enabled; }

  static std::unique_ptr<ChainParams> CreateMainNet();
  static std::unique_ptr<ChainParams> CreateTestNet();
  static std::unique_ptr<ChainParams> CreateRegTest();
  static std::unique_ptr<ChainParams> Create(ChainType type);

protected:
  void BuildGenesis();

  ConsensusParams consensus{};
  uint16_t nDefaultPort{};
  ChainType chainType{ChainType::MAIN};
  Block genesis;
  std::vector<std::string> vFixedSeeds; // host:port
};

class CMainParams : public ChainParams {
public:
  CMainParams();
};

class CTestNetParams : public ChainParams {
public:
  CTestNetParams();
};

class CRegTestParams : public ChainParams {
public:
  CRegTestParams();
};

/**
 * Genesis block: index 0, 64 zero characters as previous hash, no
 * transactions, nonce 0, merkle root sha256(""). The hash is computed, not
 * mined; genesis is exempt from the difficulty check.
 */
Block CreateGenesisBlock(double timestamp, int difficulty);

} // namespace chain
} // namespace ziacoin
