// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/validation.hpp"
#include "chain/block.hpp"
#include "chain/pow.hpp"
#include "util/logging.hpp"

namespace powledger {
namespace validation {

const char *TxResultToString(TxValidationResult result) {
  switch (result) {
  case TxValidationResult::RESULT_UNSET:
    return "RESULT_UNSET";
  case TxValidationResult::ACCOUNT_EXISTS:
    return "ACCOUNT_EXISTS";
  case TxValidationResult::UNKNOWN_ACCOUNT:
    return "UNKNOWN_ACCOUNT";
  case TxValidationResult::UNKNOWN_SENDER:
    return "UNKNOWN_SENDER";
  case TxValidationResult::UNKNOWN_RECEIVER:
    return "UNKNOWN_RECEIVER";
  case TxValidationResult::INSUFFICIENT_FUNDS:
    return "INSUFFICIENT_FUNDS";
  case TxValidationResult::AMOUNT_OVERFLOW:
    return "AMOUNT_OVERFLOW";
  case TxValidationResult::SELF_TRANSFER:
    return "SELF_TRANSFER";
  case TxValidationResult::INVALID_SENDER_ID:
    return "INVALID_SENDER_ID";
  case TxValidationResult::NOT_GENESIS_MINT:
    return "NOT_GENESIS_MINT";
  case TxValidationResult::INVALID_SIGNATURE:
    return "INVALID_SIGNATURE";
  }
  return "UNKNOWN";
}

const char *BlockResultToString(BlockValidationResult result) {
  switch (result) {
  case BlockValidationResult::RESULT_UNSET:
    return "RESULT_UNSET";
  case BlockValidationResult::INVALID_HASH:
    return "INVALID_HASH";
  case BlockValidationResult::EMPTY_BLOCK:
    return "EMPTY_BLOCK";
  case BlockValidationResult::MISSING_PREV_HASH:
    return "MISSING_PREV_HASH";
  case BlockValidationResult::UNEXPECTED_PREV_HASH:
    return "UNEXPECTED_PREV_HASH";
  case BlockValidationResult::HASH_MISMATCH:
    return "HASH_MISMATCH";
  case BlockValidationResult::HASH_ABOVE_TARGET:
    return "HASH_ABOVE_TARGET";
  case BlockValidationResult::TX_FAILED:
    return "TX_FAILED";
  }
  return "UNKNOWN";
}

bool CheckBlock(const chain::Block &block, BlockValidationState &state) {
  const std::string computed = block.ComputeHash();
  if (computed != block.GetHash()) {
    return state.Invalid(BlockValidationResult::INVALID_HASH, "bad-blk-hash",
                         "stored " + block.GetHash() + ", computed " + computed);
  }

  if (block.IsEmpty()) {
    return state.Invalid(BlockValidationResult::EMPTY_BLOCK, "bad-blk-empty",
                         "block has no transactions");
  }

  return true;
}

bool CheckBlockLinkage(const chain::Block &block, const chain::Block *prev,
                       int height, BlockValidationState &state) {
  const auto &prev_hash = block.GetPrevHash();

  if (prev == nullptr) {
    if (prev_hash) {
      state.SetHeight(height);
      return state.Invalid(BlockValidationResult::UNEXPECTED_PREV_HASH,
                           "bad-genesis-prevblk",
                           "genesis block references " + *prev_hash);
    }
    return true;
  }

  if (!prev_hash) {
    state.SetHeight(height);
    return state.Invalid(BlockValidationResult::MISSING_PREV_HASH, "bad-prevblk-missing",
                         "block at height " + std::to_string(height) +
                             " has no prev hash");
  }

  if (*prev_hash != prev->GetHash()) {
    state.SetHeight(height);
    return state.Invalid(BlockValidationResult::HASH_MISMATCH, "bad-prevblk",
                         "expected " + prev->GetHash() + ", got " + *prev_hash);
  }

  return true;
}

bool CheckProofOfWork(const chain::Block &block, uint32_t target,
                      BlockValidationState &state) {
  const uint32_t compact = consensus::GetCompactFromHash(block.GetHash());
  if (compact >= target) {
    return state.Invalid(BlockValidationResult::HASH_ABOVE_TARGET, "high-hash",
                         "compact " + consensus::FormatTarget(compact) +
                             " >= target " + consensus::FormatTarget(target));
  }

  LOG_CHAIN_TRACE("CheckProofOfWork: compact={} target={}",
                  consensus::FormatTarget(compact), consensus::FormatTarget(target));
  return true;
}

} // namespace validation
} // namespace powledger
