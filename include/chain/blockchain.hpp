// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include "chain/account.hpp"
#include "chain/block.hpp"
#include "chain/chain.hpp"
#include "chain/ledger.hpp"
#include "chain/validation.hpp"

namespace powledger {

// Forward declarations
namespace chain {
class ChainParams;
} // namespace chain

namespace validation {

// Blockchain - coordinator for ledger state
// Owns the chain, the ledger and the difficulty state. AppendBlock is the
// only entry point that changes any of them.
class Blockchain {
public:
  // LIFETIME: ChainParams reference must outlive this Blockchain
  explicit Blockchain(const chain::ChainParams &params);

  Blockchain(const Blockchain &) = delete;
  Blockchain &operator=(const Blockchain &) = delete;

  // Validate, execute and append `block`:
  //   1. CheckBlock (intact hash, non-empty)
  //   2. execute every transaction against the live ledger, restoring the
  //      pre-block snapshot on the first failure (TX_FAILED)
  //   3. non-genesis: retarget, then require hash below the new target
  //      (HASH_ABOVE_TARGET, snapshot restored)
  //   4. record timestamps, commit target/difficulty, append
  // All-or-nothing: a false return leaves every observable field unchanged.
  bool AppendBlock(chain::Block block, BlockValidationState &state);

  // Audit the committed chain oldest to newest: intact hashes and prev-hash
  // linkage. Reports the first violation (state.GetHeight()); no repair.
  bool Validate(BlockValidationState &state) const;

  // Tip's recomputed hash; std::nullopt for an empty chain
  std::optional<chain::BlockHash> GetLastBlockHash() const;

  std::optional<chain::Account> GetAccount(const chain::AccountId &id) const;
  std::optional<chain::Block> GetBlockAtHeight(int height) const;

  int GetHeight() const;
  size_t GetBlockCount() const;

  // Target in force (last committed retarget, or the initial target)
  uint32_t GetTarget() const;
  double GetDifficulty() const;

  // Target the next block will be gated on. Retargeting only depends on the
  // recorded first/last timestamps, so this is exactly what AppendBlock
  // will compute for a non-genesis block.
  uint32_t GetNextTarget() const;

  // Copy of the current ledger
  chain::Ledger GetLedger() const;

  const chain::ChainParams &GetParams() const { return params_; }

  // State dump: params, target, difficulty, accounts, blocks
  nlohmann::json ToJson() const;

  // === Test/Diagnostic Methods ===
  // Direct access to a committed block, bypassing all locking and
  // validation. Only for tests that simulate tampering.
  chain::Block *DebugGetMutableBlock(int height);

private:
  // Assumes validation_mutex_ held by caller
  uint32_t NextTargetLocked(double *difficulty_out) const;

  const chain::ChainParams &params_;
  chain::Chain chain_;
  chain::Ledger ledger_;

  uint32_t target_;
  double difficulty_{1.0};
  int64_t first_block_time_{0};
  int64_t last_block_time_{0};

  // THREAD SAFETY: AppendBlock takes the lock exclusively, all other
  // public methods take it shared
  mutable std::shared_mutex validation_mutex_;
};

} // namespace validation
} // namespace powledger
