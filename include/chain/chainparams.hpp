// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace powledger {
namespace chain {

/**
 * Chain type enumeration
 */
enum class ChainType {
  MAIN,    // Production parameters
  TESTNET, // Easy targets, retargeting on
  REGTEST  // Regression test (local testing), retargeting off
};

/**
 * Consensus parameters
 */
struct ConsensusParams {
  // Proof of Work
  uint32_t maxTarget{0};          // Ceiling for any retargeted target (easiest)
  uint32_t initialTarget{0};      // Target in force until the first retarget

  // Retargeting
  int64_t nExpectedInterval{0};   // Expected first-to-last block span (seconds)
  int64_t nMaxAdjust{1};          // Difficulty clamp: [1/nMaxAdjust, nMaxAdjust]
  bool fPowNoRetargeting{false};  // Keep the target on every block
};

/**
 * ChainParams - Chain-specific parameters
 * Simplified version of Bitcoin's CChainParams
 */
class ChainParams {
public:
  ChainParams() = default;
  virtual ~ChainParams() = default;

  // Accessors
  const ConsensusParams &GetConsensus() const { return consensus; }
  ChainType GetChainType() const { return chainType; }
  std::string GetChainTypeString() const;

  // Mutators (for test and CLI overrides)
  void SetInitialTarget(uint32_t bits) { consensus.initialTarget = bits; }
  void SetMaxTarget(uint32_t bits) { consensus.maxTarget = bits; }

  // Factory methods
  static std::unique_ptr<ChainParams> CreateMainNet();
  static std::unique_ptr<ChainParams> CreateTestNet();
  static std::unique_ptr<ChainParams> CreateRegTest();

protected:
  ConsensusParams consensus;
  ChainType chainType{ChainType::MAIN};
};

/**
 * MainNet parameters
 */
class CMainParams : public ChainParams {
public:
  CMainParams();
};

/**
 * TestNet parameters
 */
class CTestNetParams : public ChainParams {
public:
  CTestNetParams();
};

/**
 * RegTest parameters
 */
class CRegTestParams : public ChainParams {
public:
  CRegTestParams();
};

} // namespace chain
} // namespace powledger
