// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/ledger.hpp"
#include "util/logging.hpp"

namespace powledger {
namespace chain {

std::string AccountTypeToString(AccountType type) {
  switch (type) {
  case AccountType::USER:
    return "user";
  case AccountType::CONTRACT:
    return "contract";
  }
  return "unknown";
}

bool Ledger::CreateAccount(const AccountId &id, AccountType type,
                           const crypto::PublicKey &public_key,
                           validation::TxValidationState &state) {
  auto [it, inserted] = accounts_.try_emplace(id, type, public_key);
  if (!inserted) {
    return state.Invalid(validation::TxValidationResult::ACCOUNT_EXISTS,
                         "bad-tx-account-exists", "account id already exists: " + id);
  }

  LOG_CHAIN_TRACE("Ledger: created {} account {}", AccountTypeToString(type), id);
  return true;
}

const Account *Ledger::GetAccount(const AccountId &id) const {
  auto it = accounts_.find(id);
  return it == accounts_.end() ? nullptr : &it->second;
}

Account *Ledger::GetAccountMut(const AccountId &id) {
  auto it = accounts_.find(id);
  return it == accounts_.end() ? nullptr : &it->second;
}

std::optional<Balance> Ledger::TotalSupply() const {
  Balance total = 0;
  for (const auto &[id, account] : accounts_) {
    auto sum = CheckedAdd(total, account.balance);
    if (!sum) {
      return std::nullopt;
    }
    total = *sum;
  }
  return total;
}

} // namespace chain
} // namespace powledger
