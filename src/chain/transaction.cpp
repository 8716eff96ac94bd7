// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/transaction.hpp"
#include "crypto/hash.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <nlohmann/json.hpp>

namespace powledger {
namespace chain {

using validation::TxValidationResult;

namespace {
template <class... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;
} // namespace

Transaction::Transaction(TransactionPayload payload,
                         std::optional<AccountId> sender, uint64_t nonce,
                         int64_t timestamp)
    : nonce_(nonce), timestamp_(timestamp), sender_(std::move(sender)),
      payload_(std::move(payload)) {}

std::string Transaction::GetHash() const {
  crypto::HashWriter hasher;
  hasher.WriteU64(nonce_).WriteI64(timestamp_).WriteOptionalString(sender_);
  hasher.WriteU8(static_cast<uint8_t>(payload_.index()));
  std::visit(Overloaded{
                 [&](const CreateAccount &op) {
                   hasher.WriteString(op.id).WriteBytes(op.public_key);
                 },
                 [&](const MintInitialSupply &op) {
                   hasher.WriteString(op.to).WriteU128(op.amount);
                 },
                 [&](const Transfer &op) {
                   hasher.WriteString(op.to).WriteU128(op.amount);
                 },
             },
             payload_);
  return hasher.GetHex();
}

bool Transaction::VerifySignature(const Account &sender) const {
  if (!signature_) {
    return false;
  }
  return crypto::VerifySignature(sender.public_key, GetHash(), *signature_);
}

bool Transaction::Execute(Ledger &ledger, bool is_genesis,
                          validation::TxValidationState &state) const {
  return std::visit(Overloaded{
                        [&](const CreateAccount &op) {
                          return ExecuteCreateAccount(op, ledger, state);
                        },
                        [&](const MintInitialSupply &op) {
                          return ExecuteMint(op, ledger, is_genesis, state);
                        },
                        [&](const Transfer &op) {
                          return ExecuteTransfer(op, ledger, state);
                        },
                    },
                    payload_);
}

bool Transaction::ExecuteCreateAccount(const CreateAccount &op, Ledger &ledger,
                                       validation::TxValidationState &state) const {
  return ledger.CreateAccount(op.id, AccountType::USER, op.public_key, state);
}

bool Transaction::ExecuteMint(const MintInitialSupply &op, Ledger &ledger,
                              bool is_genesis,
                              validation::TxValidationState &state) const {
  if (!is_genesis) {
    return state.Invalid(TxValidationResult::NOT_GENESIS_MINT, "bad-tx-mint-not-genesis",
                         "initial supply can be minted only in the genesis block");
  }

  Account *account = ledger.GetAccountMut(op.to);
  if (!account) {
    return state.Invalid(TxValidationResult::UNKNOWN_ACCOUNT, "bad-tx-unknown-account",
                         "mint to unknown account " + op.to);
  }

  auto credited = CheckedAdd(account->balance, op.amount);
  if (!credited) {
    return state.Invalid(TxValidationResult::AMOUNT_OVERFLOW, "bad-tx-amount-overflow",
                         "mint overflows balance of " + op.to);
  }

  account->balance = *credited;
  LOG_CHAIN_DEBUG("Minted initial supply {} to {}", util::FormatU128(op.amount), op.to);
  return true;
}

bool Transaction::ExecuteTransfer(const Transfer &op, Ledger &ledger,
                                  validation::TxValidationState &state) const {
  if (!sender_) {
    return state.Invalid(TxValidationResult::INVALID_SENDER_ID, "bad-tx-missing-sender",
                         "transfer without sender id");
  }
  const AccountId &from = *sender_;

  if (from == op.to) {
    return state.Invalid(TxValidationResult::SELF_TRANSFER, "bad-tx-self-transfer",
                         "transfer from " + from + " to itself");
  }

  Account *sender = ledger.GetAccountMut(from);
  if (!sender) {
    return state.Invalid(TxValidationResult::UNKNOWN_SENDER, "bad-tx-unknown-sender",
                         "unknown sender " + from);
  }

  Account *receiver = ledger.GetAccountMut(op.to);
  if (!receiver) {
    return state.Invalid(TxValidationResult::UNKNOWN_RECEIVER, "bad-tx-unknown-receiver",
                         "unknown receiver " + op.to);
  }

  // Balance is checked before the signature. The order decides which error a
  // caller sees when both fail, so it must not be swapped.
  auto debited = CheckedSub(sender->balance, op.amount);
  if (!debited) {
    return state.Invalid(TxValidationResult::INSUFFICIENT_FUNDS, "bad-tx-insufficient-funds",
                         from + " has " + util::FormatU128(sender->balance) +
                             ", needs " + util::FormatU128(op.amount));
  }

  if (!VerifySignature(*sender)) {
    return state.Invalid(TxValidationResult::INVALID_SIGNATURE, "bad-tx-signature",
                         "signature does not verify against key of " + from);
  }

  auto credited = CheckedAdd(receiver->balance, op.amount);
  if (!credited) {
    return state.Invalid(TxValidationResult::AMOUNT_OVERFLOW, "bad-tx-amount-overflow",
                         "transfer overflows balance of " + op.to);
  }

  sender->balance = *debited;
  receiver->balance = *credited;

  LOG_CHAIN_TRACE("Transfer {} from {} to {}", util::FormatU128(op.amount), from, op.to);
  return true;
}

std::string Transaction::GetTypeString() const {
  return std::visit(Overloaded{
                        [](const CreateAccount &) { return std::string("create_account"); },
                        [](const MintInitialSupply &) { return std::string("mint_initial_supply"); },
                        [](const Transfer &) { return std::string("transfer"); },
                    },
                    payload_);
}

nlohmann::json Transaction::ToJson() const {
  nlohmann::json j;
  j["hash"] = GetHash();
  j["type"] = GetTypeString();
  j["nonce"] = nonce_;
  j["timestamp"] = timestamp_;
  j["sender"] = sender_ ? nlohmann::json(*sender_) : nlohmann::json(nullptr);
  j["signed"] = signature_.has_value();

  std::visit(Overloaded{
                 [&](const CreateAccount &op) {
                   j["id"] = op.id;
                   j["public_key"] = crypto::HexStr(op.public_key);
                 },
                 [&](const MintInitialSupply &op) {
                   j["to"] = op.to;
                   j["amount"] = util::FormatU128(op.amount);
                 },
                 [&](const Transfer &op) {
                   j["to"] = op.to;
                   j["amount"] = util::FormatU128(op.amount);
                 },
             },
             payload_);
  return j;
}

} // namespace chain
} // namespace powledger
