// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test suite for the account ledger

#include <catch2/catch_test_macros.hpp>
#include "chain/ledger.hpp"
#include "test_balance.hpp"
#include "test_keys.hpp"
#include <vector>

using namespace powledger::chain;
using namespace powledger::validation;
using powledger::test::TestKey;

TEST_CASE("Ledger account creation", "[ledger]") {
    Ledger ledger;
    TestKey key;

    SECTION("New account starts at zero") {
        TxValidationState state;
        REQUIRE(ledger.CreateAccount("alice", AccountType::USER, key.GetPublicKey(), state));
        REQUIRE(state.IsValid());

        const Account* alice = ledger.GetAccount("alice");
        REQUIRE(alice != nullptr);
        REQUIRE(alice->balance == 0);
        REQUIRE(alice->type == AccountType::USER);
        REQUIRE(alice->public_key == key.GetPublicKey());
        REQUIRE(ledger.Size() == 1);
        REQUIRE(ledger.Contains("alice"));
    }

    SECTION("Duplicate id is rejected") {
        TxValidationState first;
        REQUIRE(ledger.CreateAccount("alice", AccountType::USER, key.GetPublicKey(), first));

        TestKey other;
        TxValidationState state;
        REQUIRE_FALSE(ledger.CreateAccount("alice", AccountType::CONTRACT, other.GetPublicKey(), state));
        REQUIRE(state.GetResult() == TxValidationResult::ACCOUNT_EXISTS);
        REQUIRE(state.GetRejectReason() == "bad-tx-account-exists");

        // Original record untouched
        REQUIRE(ledger.GetAccount("alice")->public_key == key.GetPublicKey());
        REQUIRE(ledger.GetAccount("alice")->type == AccountType::USER);
        REQUIRE(ledger.Size() == 1);
    }

    SECTION("Missing account is nullptr") {
        REQUIRE(ledger.GetAccount("nobody") == nullptr);
        REQUIRE(ledger.GetAccountMut("nobody") == nullptr);
        REQUIRE_FALSE(ledger.Contains("nobody"));
        REQUIRE(ledger.Empty());
    }
}

TEST_CASE("Ledger is a value type", "[ledger]") {
    Ledger ledger;
    TestKey key;
    TxValidationState state;
    REQUIRE(ledger.CreateAccount("alice", AccountType::USER, key.GetPublicKey(), state));
    ledger.GetAccountMut("alice")->balance = 500;

    Ledger snapshot = ledger;
    REQUIRE(snapshot == ledger);

    ledger.GetAccountMut("alice")->balance = 400;
    REQUIRE_FALSE(snapshot == ledger);
    REQUIRE(snapshot.GetAccount("alice")->balance == 500);

    ledger = snapshot;
    REQUIRE(ledger == snapshot);
}

TEST_CASE("Ledger iteration and total supply", "[ledger]") {
    Ledger ledger;
    TestKey key;
    TxValidationState state;
    REQUIRE(ledger.CreateAccount("carol", AccountType::USER, key.GetPublicKey(), state));
    REQUIRE(ledger.CreateAccount("alice", AccountType::USER, key.GetPublicKey(), state));
    REQUIRE(ledger.CreateAccount("bob", AccountType::USER, key.GetPublicKey(), state));
    ledger.GetAccountMut("alice")->balance = 10;
    ledger.GetAccountMut("bob")->balance = 20;

    std::vector<AccountId> ids;
    for (const auto& [id, account] : ledger) {
        ids.push_back(id);
    }
    REQUIRE(ids == std::vector<AccountId>{"alice", "bob", "carol"});

    REQUIRE(ledger.TotalSupply() == Balance{30});

    ledger.GetAccountMut("carol")->balance = ~Balance{0};
    REQUIRE_FALSE(ledger.TotalSupply().has_value());
}

TEST_CASE("Checked balance arithmetic", "[ledger]") {
    const Balance max = ~Balance{0};

    REQUIRE(CheckedAdd(1, 2) == Balance{3});
    REQUIRE(CheckedAdd(max, 0) == max);
    REQUIRE_FALSE(CheckedAdd(max, 1).has_value());

    REQUIRE(CheckedSub(5, 5) == Balance{0});
    REQUIRE_FALSE(CheckedSub(4, 5).has_value());
}

TEST_CASE("AccountTypeToString", "[ledger]") {
    REQUIRE(AccountTypeToString(AccountType::USER) == "user");
    REQUIRE(AccountTypeToString(AccountType::CONTRACT) == "contract");
}
