// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block.hpp"
#include "chain/pow.hpp"
#include "crypto/hash.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace powledger {
namespace chain {

Block::Block(std::optional<BlockHash> prev_hash)
    : timestamp_(util::GetTime()), prev_hash_(std::move(prev_hash)) {
  UpdateHash();
}

void Block::SetNonce(uint64_t nonce) {
  nonce_ = nonce;
  UpdateHash();
}

void Block::AddTransaction(Transaction tx) {
  tx_hashes_.push_back(tx.GetHash());
  transactions_.push_back(std::move(tx));
  UpdateHash();
}

bool Block::Verify() const { return ComputeHash() == hash_; }

bool Block::Mine(uint32_t target, const std::atomic<bool> *interrupt) {
  const uint64_t start_nonce = nonce_;

  while (!consensus::CheckProofOfWork(hash_, target)) {
    if (interrupt && interrupt->load(std::memory_order_relaxed)) {
      LOG_MINING_TRACE("Block::Mine interrupted after {} attempts", nonce_ - start_nonce);
      return false;
    }
    SetNonce(nonce_ + 1);
  }

  LOG_MINING_TRACE("Block::Mine found nonce={} hash={} after {} attempts", nonce_,
                   hash_.substr(0, 16), nonce_ - start_nonce);
  return true;
}

bool Block::Mine(const std::string &target_hex, const std::atomic<bool> *interrupt) {
  auto target = consensus::ParseTarget(target_hex);
  if (!target) {
    throw std::invalid_argument("Block::Mine: malformed target '" + target_hex + "'");
  }
  return Mine(*target, interrupt);
}

BlockHash Block::ComputeHash() const {
  std::vector<std::string> tx_hashes;
  tx_hashes.reserve(transactions_.size());
  for (const auto &tx : transactions_) {
    tx_hashes.push_back(tx.GetHash());
  }
  return HashWith(tx_hashes);
}

void Block::UpdateHash() { hash_ = HashWith(tx_hashes_); }

BlockHash Block::HashWith(const std::vector<std::string> &tx_hashes) const {
  crypto::HashWriter hasher;
  hasher.WriteOptionalString(prev_hash_).WriteU64(nonce_);
  for (const auto &tx_hash : tx_hashes) {
    hasher.WriteRaw(tx_hash);
  }
  return hasher.GetHex();
}

Transaction *Block::DebugGetMutableTransaction(size_t index) {
  if (index >= transactions_.size()) {
    return nullptr;
  }
  return &transactions_[index];
}

std::string Block::ToString() const {
  std::stringstream s;
  s << "Block(\n";
  s << "  hash=" << hash_ << "\n";
  s << "  prevHash=" << prev_hash_.value_or("none") << "\n";
  s << "  nonce=" << nonce_ << "\n";
  s << "  time=" << timestamp_ << " (" << util::FormatTime(timestamp_) << ")\n";
  s << "  txs=" << transactions_.size() << "\n";
  for (size_t i = 0; i < transactions_.size(); ++i) {
    s << "    [" << i << "] " << transactions_[i].GetTypeString() << " "
      << transactions_[i].GetHash() << "\n";
  }
  s << ")\n";
  return s.str();
}

nlohmann::json Block::ToJson() const {
  nlohmann::json j;
  j["hash"] = hash_;
  j["prev_hash"] = prev_hash_ ? nlohmann::json(*prev_hash_) : nlohmann::json(nullptr);
  j["nonce"] = nonce_;
  j["timestamp"] = timestamp_;

  nlohmann::json txs = nlohmann::json::array();
  for (const auto &tx : transactions_) {
    txs.push_back(tx.ToJson());
  }
  j["transactions"] = std::move(txs);
  return j;
}

} // namespace chain
} // namespace powledger
