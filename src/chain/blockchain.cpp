// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/blockchain.hpp"
#include <mutex>
#include <utility>
#include "chain/chainparams.hpp"
#include "chain/pow.hpp"
#include "crypto/hash.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <nlohmann/json.hpp>

namespace powledger {
namespace validation {

Blockchain::Blockchain(const chain::ChainParams &params)
    : params_(params), target_(params.GetConsensus().initialTarget) {}

bool Blockchain::AppendBlock(chain::Block block, BlockValidationState &state) {
  std::unique_lock<std::shared_mutex> lock(validation_mutex_);

  const std::string hash = block.GetHash();
  LOG_CHAIN_TRACE("AppendBlock: hash={} prev={} txs={}", hash.substr(0, 16),
                  block.GetPrevHash().value_or("none").substr(0, 16),
                  block.GetTransactions().size());

  // Step 1: Context-free checks
  if (!CheckBlock(block, state)) {
    LOG_CHAIN_DEBUG("AppendBlock: block {} rejected: {}", hash.substr(0, 16),
                    state.ToString());
    return false;
  }

  const bool is_genesis = chain_.Empty();

  // Step 2: Execute transactions against the live ledger. The snapshot is a
  // full copy, O(ledger size) per block.
  const chain::Ledger snapshot = ledger_;
  const auto &txs = block.GetTransactions();
  for (size_t i = 0; i < txs.size(); ++i) {
    TxValidationState tx_state;
    if (!txs[i].Execute(ledger_, is_genesis, tx_state)) {
      ledger_ = snapshot;
      LOG_CHAIN_DEBUG("AppendBlock: block {} tx {} ({}) failed: {}",
                      hash.substr(0, 16), i, TxResultToString(tx_state.GetResult()),
                      tx_state.ToString());
      return state.InvalidTx(i, tx_state);
    }
  }

  // Step 3: Retarget and gate on proof of work (not for genesis)
  uint32_t new_target = target_;
  double new_difficulty = difficulty_;
  if (!is_genesis) {
    new_target = NextTargetLocked(&new_difficulty);
    if (!CheckProofOfWork(block, new_target, state)) {
      ledger_ = snapshot;
      LOG_CHAIN_DEBUG("AppendBlock: block {} rejected: {}", hash.substr(0, 16),
                      state.ToString());
      return false;
    }
  }

  // Step 4: Commit
  const int64_t now = util::GetTime();
  if (is_genesis) {
    first_block_time_ = now;
  }
  last_block_time_ = now;
  target_ = new_target;
  difficulty_ = new_difficulty;
  const size_t tx_count = txs.size();
  const int height = chain_.Append(std::move(block));

  LOG_CHAIN_INFO("UpdateTip: new best={} height={} txs={} target={} difficulty={:.4f} date='{}'",
                 hash.substr(0, 16), height, tx_count,
                 consensus::FormatTarget(target_), difficulty_, util::FormatTime(now));
  return true;
}

bool Blockchain::Validate(BlockValidationState &state) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);

  const chain::Block *prev = nullptr;
  int height = 0;
  for (const auto &block : chain_) {
    if (!CheckBlock(block, state) || !CheckBlockLinkage(block, prev, height, state)) {
      state.SetHeight(height);
      LOG_CHAIN_WARN("Validate: chain invalid at height {}: {}", height, state.ToString());
      return false;
    }
    prev = &block;
    ++height;
  }

  LOG_CHAIN_TRACE("Validate: {} blocks OK", chain_.Size());
  return true;
}

std::optional<chain::BlockHash> Blockchain::GetLastBlockHash() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  const chain::Block *tip = chain_.Tip();
  if (!tip) {
    return std::nullopt;
  }
  return tip->ComputeHash();
}

std::optional<chain::Account> Blockchain::GetAccount(const chain::AccountId &id) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  const chain::Account *account = ledger_.GetAccount(id);
  if (!account) {
    return std::nullopt;
  }
  return *account;
}

std::optional<chain::Block> Blockchain::GetBlockAtHeight(int height) const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  const chain::Block *block = chain_[height];
  if (!block) {
    return std::nullopt;
  }
  return *block;
}

int Blockchain::GetHeight() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return chain_.Height();
}

size_t Blockchain::GetBlockCount() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return chain_.Size();
}

uint32_t Blockchain::GetTarget() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return target_;
}

double Blockchain::GetDifficulty() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return difficulty_;
}

uint32_t Blockchain::GetNextTarget() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  if (chain_.Empty()) {
    // Genesis is not gated on proof of work
    return target_;
  }
  return NextTargetLocked(nullptr);
}

uint32_t Blockchain::NextTargetLocked(double *difficulty_out) const {
  const consensus::RetargetResult next = consensus::CalculateNextTarget(
      target_, first_block_time_, last_block_time_, params_);
  if (difficulty_out) {
    *difficulty_out = next.difficulty;
  }
  return next.target;
}

chain::Ledger Blockchain::GetLedger() const {
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);
  return ledger_;
}

nlohmann::json Blockchain::ToJson() const {
  using json = nlohmann::json;
  std::shared_lock<std::shared_mutex> lock(validation_mutex_);

  json root;
  root["chain"] = params_.GetChainTypeString();
  root["height"] = chain_.Height();
  root["target"] = consensus::FormatTarget(target_);
  root["difficulty"] = difficulty_;
  root["first_block_time"] = first_block_time_;
  root["last_block_time"] = last_block_time_;

  json accounts = json::object();
  for (const auto &[id, account] : ledger_) {
    json entry;
    entry["type"] = chain::AccountTypeToString(account.type);
    // Decimal string: 128-bit balances do not fit a JSON number
    entry["balance"] = util::FormatU128(account.balance);
    entry["public_key"] = crypto::HexStr(account.public_key);
    accounts[id] = entry;
  }
  root["accounts"] = accounts;

  json blocks = json::array();
  for (const auto &block : chain_) {
    blocks.push_back(block.ToJson());
  }
  root["blocks"] = blocks;

  return root;
}

chain::Block *Blockchain::DebugGetMutableBlock(int height) {
  return chain_.GetMutable(height);
}

} // namespace validation
} // namespace powledger
