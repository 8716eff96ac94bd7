// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/transaction.hpp"
#include <atomic>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace powledger {
namespace chain {

using BlockHash = std::string;

// Block - ordered transactions sealed by a proof-of-work nonce
//
// The self-hash is Blake2s(prev_hash, pow_nonce, txhash_1 .. txhash_n) and is
// recomputed by every mutator, so GetHash() is never stale for a block built
// through this API. The timestamp is informational and not hashed.
class Block {
public:
  // Timestamp is taken from util::GetTime()
  explicit Block(std::optional<BlockHash> prev_hash = std::nullopt);

  void SetNonce(uint64_t nonce);
  void AddTransaction(Transaction tx);

  // Recompute the hash from current contents and compare with the stored one
  [[nodiscard]] bool Verify() const;

  // Increment the nonce until the block hash meets `target`. Checks
  // `interrupt` once per attempt and returns false if it was raised.
  bool Mine(uint32_t target, const std::atomic<bool> *interrupt = nullptr);

  // Same as above with a hex target. Throws std::invalid_argument on
  // malformed hex.
  bool Mine(const std::string &target_hex,
            const std::atomic<bool> *interrupt = nullptr);

  // Fresh hash over the current contents (ignores the stored one)
  [[nodiscard]] BlockHash ComputeHash() const;

  const BlockHash &GetHash() const { return hash_; }
  const std::optional<BlockHash> &GetPrevHash() const { return prev_hash_; }
  uint64_t GetNonce() const { return nonce_; }
  int64_t GetTimestamp() const { return timestamp_; }
  const std::vector<Transaction> &GetTransactions() const { return transactions_; }
  bool IsEmpty() const { return transactions_.empty(); }

  [[nodiscard]] std::string ToString() const;
  nlohmann::json ToJson() const;

  // === Test/Diagnostic Methods ===
  // Direct access that bypasses rehashing; used to simulate tampering
  Transaction *DebugGetMutableTransaction(size_t index);
  void DebugSetPrevHash(std::optional<BlockHash> prev_hash) { prev_hash_ = std::move(prev_hash); }

private:
  void UpdateHash();
  BlockHash HashWith(const std::vector<std::string> &tx_hashes) const;

  uint64_t nonce_{0};
  int64_t timestamp_{0};
  BlockHash hash_;
  std::optional<BlockHash> prev_hash_;
  std::vector<Transaction> transactions_;

  // Content hashes of transactions_, kept in step by AddTransaction so
  // mining only rehashes the header fields
  std::vector<std::string> tx_hashes_;
};

} // namespace chain
} // namespace powledger
