// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test suite for Block hashing, tamper detection and mining

#include <catch2/catch_test_macros.hpp>
#include "chain/block.hpp"
#include "chain/pow.hpp"
#include "test_keys.hpp"
#include "util/time.hpp"
#include <atomic>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace powledger;
using namespace powledger::chain;
using powledger::test::TestKey;

TEST_CASE("Block construction", "[block]") {
    util::MockTimeScope mock_time(1700000000);

    Block block;
    REQUIRE(block.GetNonce() == 0);
    REQUIRE(block.GetTimestamp() == 1700000000);
    REQUIRE_FALSE(block.GetPrevHash().has_value());
    REQUIRE(block.IsEmpty());
    REQUIRE(block.GetHash().size() == 64);
    REQUIRE(block.Verify());

    Block child(block.GetHash());
    REQUIRE(child.GetPrevHash() == block.GetHash());
    REQUIRE(child.GetHash() != block.GetHash());
}

TEST_CASE("Block hash tracks every mutation", "[block]") {
    TestKey key;
    Block block;
    const std::string h0 = block.GetHash();

    block.SetNonce(5);
    REQUIRE(block.Verify());
    REQUIRE(block.GetHash() != h0);
    const std::string h1 = block.GetHash();

    block.AddTransaction(Transaction(CreateAccount{"alice", key.GetPublicKey()}));
    REQUIRE(block.Verify());
    REQUIRE(block.GetHash() != h1);
    REQUIRE(block.GetTransactions().size() == 1);

    // Returning to a previous nonce with the same contents reproduces the hash
    Block again;
    again.SetNonce(5);
    REQUIRE(again.GetHash() == h1);
}

TEST_CASE("Block timestamp is not hashed", "[block]") {
    std::string first;
    {
        util::MockTimeScope mock_time(1000);
        Block block;
        first = block.GetHash();
    }
    util::MockTimeScope mock_time(2000);
    Block block;
    REQUIRE(block.GetTimestamp() == 2000);
    REQUIRE(block.GetHash() == first);
}

TEST_CASE("Block tamper detection", "[block]") {
    TestKey key;
    Block block;
    block.AddTransaction(Transaction(MintInitialSupply{"alice", 100}));
    block.AddTransaction(Transaction(CreateAccount{"bob", key.GetPublicKey()}));
    REQUIRE(block.Verify());

    SECTION("Payload altered in place") {
        block.DebugGetMutableTransaction(0)->DebugSetPayload(MintInitialSupply{"alice", 1000000});
        REQUIRE_FALSE(block.Verify());
        REQUIRE(block.ComputeHash() != block.GetHash());
    }

    SECTION("Prev hash altered in place") {
        block.DebugSetPrevHash(std::string(64, 'a'));
        REQUIRE_FALSE(block.Verify());
    }

    SECTION("Out of range index") {
        REQUIRE(block.DebugGetMutableTransaction(2) == nullptr);
    }
}

TEST_CASE("Block mining", "[block][mining]") {
    Block block;
    block.AddTransaction(Transaction(MintInitialSupply{"alice", 1}));

    SECTION("Mine meets the target") {
        const uint32_t target = 0x20ffffff;
        REQUIRE(block.Mine(target));
        REQUIRE(consensus::CheckProofOfWork(block.GetHash(), target));
        REQUIRE(block.Verify());
    }

    SECTION("Mine from hex target") {
        REQUIRE(block.Mine("2003ffff"));
        REQUIRE(consensus::GetCompactFromHash(block.GetHash()) < 0x2003ffffu);
    }

    SECTION("Malformed hex target throws") {
        REQUIRE_THROWS_AS(block.Mine("not-hex"), std::invalid_argument);
        REQUIRE_THROWS_AS(block.Mine(""), std::invalid_argument);
    }

    SECTION("Interrupt stops an impossible search") {
        std::atomic<bool> interrupt{true};
        const uint64_t nonce = block.GetNonce();
        REQUIRE_FALSE(block.Mine(0u, &interrupt));
        REQUIRE(block.GetNonce() == nonce);
        REQUIRE(block.Verify());
    }
}

TEST_CASE("Block descriptions", "[block]") {
    util::MockTimeScope mock_time(1700000000);
    Block block(std::string(64, 'b'));
    block.AddTransaction(Transaction(MintInitialSupply{"alice", 42}));

    nlohmann::json j = block.ToJson();
    REQUIRE(j["hash"] == block.GetHash());
    REQUIRE(j["prev_hash"] == std::string(64, 'b'));
    REQUIRE(j["nonce"] == 0);
    REQUIRE(j["timestamp"] == 1700000000);
    REQUIRE(j["transactions"].size() == 1);
    REQUIRE(j["transactions"][0]["amount"] == "42");

    const std::string s = block.ToString();
    REQUIRE(s.find(block.GetHash()) != std::string::npos);
    REQUIRE(s.find("mint_initial_supply") != std::string::npos);
}
