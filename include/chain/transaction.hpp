// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/account.hpp"
#include "chain/ledger.hpp"
#include "chain/validation.hpp"
#include "crypto/signature.hpp"
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace powledger {
namespace chain {

// Register `id` with verification key `public_key` (always a USER account)
struct CreateAccount {
  AccountId id;
  crypto::PublicKey public_key{};

  bool operator==(const CreateAccount &other) const = default;
};

// One-time bootstrap credit; accepted only inside the genesis block
struct MintInitialSupply {
  AccountId to;
  Balance amount{0};

  bool operator==(const MintInitialSupply &other) const = default;
};

// Move `amount` from the transaction's sender to `to`; must be signed
struct Transfer {
  AccountId to;
  Balance amount{0};

  bool operator==(const Transfer &other) const = default;
};

using TransactionPayload = std::variant<CreateAccount, MintInitialSupply, Transfer>;

// Transaction - immutable payload plus an optional sender signature
//
// The content hash covers (nonce, timestamp, sender, payload) and not the
// signature; the signing oracle signs the hex content hash, so attaching a
// signature never changes what was signed.
class Transaction {
public:
  explicit Transaction(TransactionPayload payload,
                       std::optional<AccountId> sender = std::nullopt,
                       uint64_t nonce = 0, int64_t timestamp = 0);

  // Blake2s-256 content hash, lowercase hex
  [[nodiscard]] std::string GetHash() const;

  void SetSignature(const crypto::Signature &signature) { signature_ = signature; }

  // True iff a signature is attached and verifies against `sender`'s key
  [[nodiscard]] bool VerifySignature(const Account &sender) const;

  // Apply this transaction to `ledger`. On failure the ledger is untouched
  // and `state` carries the reason.
  bool Execute(Ledger &ledger, bool is_genesis,
               validation::TxValidationState &state) const;

  uint64_t GetNonce() const { return nonce_; }
  int64_t GetTimestamp() const { return timestamp_; }
  const std::optional<AccountId> &GetSender() const { return sender_; }
  const TransactionPayload &GetPayload() const { return payload_; }
  const std::optional<crypto::Signature> &GetSignature() const { return signature_; }

  // "create_account" / "mint_initial_supply" / "transfer"
  std::string GetTypeString() const;

  nlohmann::json ToJson() const;

  // === Test/Diagnostic Methods ===
  // Replaces the payload in place, leaving the signature attached. Used only
  // by tests that simulate tampering with signed or committed transactions.
  void DebugSetPayload(TransactionPayload payload) { payload_ = std::move(payload); }

private:
  bool ExecuteCreateAccount(const CreateAccount &op, Ledger &ledger,
                            validation::TxValidationState &state) const;
  bool ExecuteMint(const MintInitialSupply &op, Ledger &ledger, bool is_genesis,
                   validation::TxValidationState &state) const;
  bool ExecuteTransfer(const Transfer &op, Ledger &ledger,
                       validation::TxValidationState &state) const;

  uint64_t nonce_;
  int64_t timestamp_;
  std::optional<AccountId> sender_;
  TransactionPayload payload_;
  std::optional<crypto::Signature> signature_;
};

} // namespace chain
} // namespace powledger
