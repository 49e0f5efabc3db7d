// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chainparams.hpp"

#include "chain/merkle.hpp"
#include "network/protocol.hpp"

namespace ziacoin {
namespace chain {

Block CreateGenesisBlock(double timestamp, int difficulty) {
  Block genesis;
  genesis.index = 0;
  genesis.timestamp = timestamp;
  genesis.previous_hash = std::string(64, '0');
  genesis.nonce = 0;
  genesis.difficulty = difficulty;
  genesis.merkle_root = consensus::ComputeMerkleRoot(genesis.transactions);
  genesis.hash = genesis.ComputeHash();
  return genesis;
}

std::string ChainParams::GetChainTypeString() const {
  switch (chainType) {
  case ChainType::MAIN:
    return "main";
  case ChainType::TESTNET:
    return "test";
  case ChainType::REGTEST:
    return "regtest";
  }
  return "unknown";
}

void ChainParams::SetInitialDifficulty(int difficulty) {
  consensus.nInitialDifficulty = difficulty;
  BuildGenesis();
}

void ChainParams::BuildGenesis() {
  genesis = CreateGenesisBlock(consensus.nGenesisTime,
                               consensus.nInitialDifficulty);
}

std::unique_ptr<ChainParams> ChainParams::CreateMainNet() {
  return std::make_unique<CMainParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateTestNet() {
  return std::make_unique<CTestNetParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateRegTest() {
  return std::make_unique<CRegTestParams>();
}

std::unique_ptr<ChainParams> ChainParams::Create(ChainType type) {
  switch (type) {
  case ChainType::MAIN:
    return CreateMainNet();
  case ChainType::TESTNET:
    return CreateTestNet();
  case ChainType::REGTEST:
    return CreateRegTest();
  }
  return CreateMainNet();
}

// ============================================================================
// MainNet
// ============================================================================

CMainParams::CMainParams() {
  chainType = ChainType::MAIN;

  consensus.nInitialDifficulty = 4;
  consensus.nTargetBlockTime = 60.0;
  consensus.fPowNoRetargeting = false;
  consensus.nMaxTxAge = 60 * 60;
  consensus.nGenesisTime = 1735689600.0; // 2025-01-01 00:00:00 UTC

  nDefaultPort = protocol::ports::MAINNET;
  BuildGenesis();

  vFixedSeeds.push_back("seed1.ziacoin.net:8333");
  vFixedSeeds.push_back("seed2.ziacoin.net:8333");
}

// ============================================================================
// TestNet
// ============================================================================

CTestNetParams::CTestNetParams() {
  chainType = ChainType::TESTNET;

  consensus.nInitialDifficulty = 2;
  consensus.nTargetBlockTime = 60.0;
  consensus.fPowNoRetargeting = false;
  consensus.nMaxTxAge = 60 * 60;
  consensus.nGenesisTime = 1735776000.0; // 2025-01-02 00:00:00 UTC

  nDefaultPort = protocol::ports::TESTNET;
  BuildGenesis();
}

// ============================================================================
// RegTest
// ============================================================================

CRegTestParams::CRegTestParams() {
  chainType = ChainType::REGTEST;

  // Trivial, fixed difficulty so tests can mine instantly
  consensus.nInitialDifficulty = 1;
  consensus.nTargetBlockTime = 60.0;
  consensus.fPowNoRetargeting = true;
  consensus.nMaxTxAge = 60 * 60;
  consensus.nGenesisTime = 1735689600.0;

  nDefaultPort = protocol::ports::REGTEST;
  BuildGenesis();
}

} // namespace chain
} // namespace ziacoin
