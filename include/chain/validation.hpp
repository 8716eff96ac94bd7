// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace powledger {

namespace chain {
class Block;
} // namespace chain

namespace validation {

/**
 * ============================================================================
 * BLOCK VALIDATION ARCHITECTURE
 * ============================================================================
 *
 * LAYER 1: Context-free block checks
 * - CheckBlock()              : self-hash intact, at least one transaction
 *
 * LAYER 2: State transition (requires ledger)
 * - Transaction::Execute()    : per-transaction rules, TxValidationState
 *
 * LAYER 3: Contextual checks (requires chain position)
 * - CheckBlockLinkage()       : prev-hash presence and continuity
 * - CheckProofOfWork()        : compact hash below the retargeted target
 *
 * INTEGRATION POINT:
 * - Blockchain::AppendBlock() runs layers 1-3 for new blocks
 * - Blockchain::Validate() re-audits layers 1 and 3 (linkage) for the chain
 * ============================================================================
 */

// Why a transaction was rejected
enum class TxValidationResult {
  RESULT_UNSET = 0,
  ACCOUNT_EXISTS,    // CreateAccount for an id that already exists
  UNKNOWN_ACCOUNT,   // MintInitialSupply to a missing account
  UNKNOWN_SENDER,    // Transfer from a missing account
  UNKNOWN_RECEIVER,  // Transfer to a missing account
  INSUFFICIENT_FUNDS,
  AMOUNT_OVERFLOW,   // credit would overflow the receiver's balance
  SELF_TRANSFER,
  INVALID_SENDER_ID, // Transfer without a sender id
  NOT_GENESIS_MINT,  // MintInitialSupply outside the genesis block
  INVALID_SIGNATURE,
};

// Why a block (or a committed block during a chain audit) was rejected
enum class BlockValidationResult {
  RESULT_UNSET = 0,
  INVALID_HASH,         // stored self-hash does not match contents
  EMPTY_BLOCK,
  MISSING_PREV_HASH,    // non-genesis block without prev hash
  UNEXPECTED_PREV_HASH, // genesis block with a prev hash
  HASH_MISMATCH,        // prev hash does not match preceding block
  HASH_ABOVE_TARGET,    // proof of work does not meet the target
  TX_FAILED,            // a contained transaction failed, see GetTxResult()
};

const char *TxResultToString(TxValidationResult result);
const char *BlockResultToString(BlockValidationResult result);

/**
 * Validation state - tracks why validation failed
 * Shape follows Bitcoin Core's ValidationState<Result>
 */
template <typename Result> class ValidationState {
public:
  enum class Mode {
    VALID,
    INVALID, // Rule violation
    ERROR    // System error
  };

  bool Invalid(Result result, const std::string &reject_reason,
               const std::string &debug_message = "") {
    mode_ = Mode::INVALID;
    result_ = result;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(const std::string &reject_reason,
             const std::string &debug_message = "") {
    mode_ = Mode::ERROR;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool IsValid() const { return mode_ == Mode::VALID; }
  bool IsInvalid() const { return mode_ == Mode::INVALID; }
  bool IsError() const { return mode_ == Mode::ERROR; }

  Result GetResult() const { return result_; }
  const std::string &GetRejectReason() const { return reject_reason_; }
  const std::string &GetDebugMessage() const { return debug_message_; }

  std::string ToString() const {
    if (IsValid()) {
      return "Valid";
    }
    if (debug_message_.empty()) {
      return reject_reason_;
    }
    return reject_reason_ + ", " + debug_message_;
  }

private:
  Mode mode_{Mode::VALID};
  Result result_{};
  std::string reject_reason_;
  std::string debug_message_;
};

class TxValidationState : public ValidationState<TxValidationResult> {};

class BlockValidationState : public ValidationState<BlockValidationResult> {
public:
  // Record the failing transaction. Marks the block TX_FAILED and keeps the
  // transaction's own result code and reason.
  bool InvalidTx(size_t tx_index, const TxValidationState &tx_state) {
    tx_result_ = tx_state.GetResult();
    tx_index_ = tx_index;
    return Invalid(BlockValidationResult::TX_FAILED, tx_state.GetRejectReason(),
                   "tx " + std::to_string(tx_index) + ": " + tx_state.GetDebugMessage());
  }

  TxValidationResult GetTxResult() const { return tx_result_; }
  size_t GetTxIndex() const { return tx_index_; }

  // Position of the offending block (chain audits), -1 when not applicable
  void SetHeight(int height) { height_ = height; }
  int GetHeight() const { return height_; }

private:
  TxValidationResult tx_result_{TxValidationResult::RESULT_UNSET};
  size_t tx_index_{0};
  int height_{-1};
};

// Context-free checks: intact self-hash and at least one transaction
bool CheckBlock(const chain::Block &block, BlockValidationState &state);

// Linkage of `block` at `height` against its predecessor (nullptr for
// genesis): genesis carries no prev hash, every other block carries one
// equal to the predecessor's hash
bool CheckBlockLinkage(const chain::Block &block, const chain::Block *prev,
                       int height, BlockValidationState &state);

// Block hash meets `target` (compact bits)
bool CheckProofOfWork(const chain::Block &block, uint32_t target,
                      BlockValidationState &state);

} // namespace validation
} // namespace powledger
