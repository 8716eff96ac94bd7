// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/account.hpp"
#include "chain/validation.hpp"
#include <map>

namespace powledger {
namespace chain {

// Ledger - account id -> account record
//
// Value type: copying a Ledger is how Blockchain snapshots state before a
// block executes, and operator== is how tests prove a failed block left no
// trace. Accounts are never removed.
class Ledger {
public:
  using AccountMap = std::map<AccountId, Account>;

  // Insert a zero-balance account. Fails ACCOUNT_EXISTS if `id` is taken.
  bool CreateAccount(const AccountId &id, AccountType type,
                     const crypto::PublicKey &public_key,
                     validation::TxValidationState &state);

  // nullptr when absent
  const Account *GetAccount(const AccountId &id) const;
  Account *GetAccountMut(const AccountId &id);

  bool Contains(const AccountId &id) const { return accounts_.count(id) > 0; }
  size_t Size() const { return accounts_.size(); }
  bool Empty() const { return accounts_.empty(); }

  // Iteration in id order
  AccountMap::const_iterator begin() const { return accounts_.begin(); }
  AccountMap::const_iterator end() const { return accounts_.end(); }

  // Sum of all balances, std::nullopt if it does not fit in a Balance
  std::optional<Balance> TotalSupply() const;

  bool operator==(const Ledger &other) const = default;

private:
  AccountMap accounts_;
};

} // namespace chain
} // namespace powledger
