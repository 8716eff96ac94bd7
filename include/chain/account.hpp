// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/signature.hpp"
#include "util/uint128.hpp"
#include <optional>
#include <string>

namespace powledger {
namespace chain {

using AccountId = std::string;

// Balances are unsigned 128-bit: never negative, overflow is checked
using Balance = util::uint128_t;

enum class AccountType {
  USER,
  CONTRACT
};

struct Account {
  AccountType type{AccountType::USER};
  Balance balance{0};
  crypto::PublicKey public_key{};

  Account() = default;
  Account(AccountType type_in, const crypto::PublicKey &key)
      : type(type_in), public_key(key) {}

  bool operator==(const Account &other) const = default;
};

std::string AccountTypeToString(AccountType type);

// std::nullopt on overflow (never wraps)
[[nodiscard]] inline std::optional<Balance> CheckedAdd(Balance a, Balance b) {
  Balance sum = a + b;
  if (sum < a) {
    return std::nullopt;
  }
  return sum;
}

// std::nullopt on underflow
[[nodiscard]] inline std::optional<Balance> CheckedSub(Balance a, Balance b) {
  if (b > a) {
    return std::nullopt;
  }
  return a - b;
}

} // namespace chain
} // namespace powledger
