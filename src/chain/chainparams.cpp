// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chainparams.hpp"

namespace powledger {
namespace chain {

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

std::unique_ptr<ChainParams> ChainParams::CreateMainNet() {
  return std::make_unique<CMainParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateTestNet() {
  return std::make_unique<CTestNetParams>();
}

std::unique_ptr<ChainParams> ChainParams::CreateRegTest() {
  return std::make_unique<CRegTestParams>();
}

// ============================================================================
// MainNet Parameters
// ============================================================================

CMainParams::CMainParams() {
  chainType = ChainType::MAIN;

  consensus.maxTarget = 0x20ffffff;
  // Hashes must start with at least one zero nibble
  consensus.initialTarget = 0x1f0fffff;

  // One Bitcoin epoch: 2016 blocks at 10 minutes
  consensus.nExpectedInterval = 2016 * 10 * 60;
  consensus.nMaxAdjust = 4;
  consensus.fPowNoRetargeting = false;
}

// ============================================================================
// TestNet Parameters
// ============================================================================

CTestNetParams::CTestNetParams() {
  chainType = ChainType::TESTNET;

  // Easiest possible target, retargeting still exercised
  consensus.maxTarget = 0x20ffffff;
  consensus.initialTarget = 0x20ffffff;

  consensus.nExpectedInterval = 2016 * 10 * 60;
  consensus.nMaxAdjust = 4;
  consensus.fPowNoRetargeting = false;
}

// ============================================================================
// RegTest Parameters (Local testing)
// ============================================================================

CRegTestParams::CRegTestParams() {
  chainType = ChainType::REGTEST;

  // Very easy difficulty - near-instant block generation
  consensus.maxTarget = 0x20ffffff;
  consensus.initialTarget = 0x20ffffff;

  consensus.nExpectedInterval = 2016 * 10 * 60;
  consensus.nMaxAdjust = 4;
  consensus.fPowNoRetargeting = true;
}

} // namespace chain
} // namespace powledger
