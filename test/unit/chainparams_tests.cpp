// Copyright (c) 2025 The Unicity Foundation
// Test suite for chain parameters

#include <catch2/catch_test_macros.hpp>
#include "chain/chainparams.hpp"

using namespace powledger::chain;

TEST_CASE("ChainParams creation", "[chainparams]") {
    SECTION("Create MainNet") {
        auto params = ChainParams::CreateMainNet();
        REQUIRE(params != nullptr);
        REQUIRE(params->GetChainType() == ChainType::MAIN);
        REQUIRE(params->GetChainTypeString() == "main");

        const auto& consensus = params->GetConsensus();
        REQUIRE(consensus.maxTarget == 0x20ffffff);
        REQUIRE(consensus.initialTarget == 0x1f0fffff);
        REQUIRE(consensus.nExpectedInterval == 2016 * 600);
        REQUIRE(consensus.nMaxAdjust == 4);
        REQUIRE_FALSE(consensus.fPowNoRetargeting);
    }

    SECTION("Create TestNet") {
        auto params = ChainParams::CreateTestNet();
        REQUIRE(params != nullptr);
        REQUIRE(params->GetChainType() == ChainType::TESTNET);
        REQUIRE(params->GetChainTypeString() == "test");
        REQUIRE(params->GetConsensus().initialTarget == 0x20ffffff);
        REQUIRE_FALSE(params->GetConsensus().fPowNoRetargeting);
    }

    SECTION("Create RegTest") {
        auto params = ChainParams::CreateRegTest();
        REQUIRE(params != nullptr);
        REQUIRE(params->GetChainType() == ChainType::REGTEST);
        REQUIRE(params->GetChainTypeString() == "regtest");

        // RegTest has easy difficulty for instant mining
        const auto& consensus = params->GetConsensus();
        REQUIRE(consensus.initialTarget == consensus.maxTarget);
        REQUIRE(consensus.fPowNoRetargeting);
    }
}

TEST_CASE("ChainParams overrides", "[chainparams]") {
    auto params = ChainParams::CreateMainNet();
    params->SetInitialTarget(0x1e00ffff);
    REQUIRE(params->GetConsensus().initialTarget == 0x1e00ffff);

    params->SetMaxTarget(0x1f00ffff);
    REQUIRE(params->GetConsensus().maxTarget == 0x1f00ffff);

    // Other networks are unaffected
    REQUIRE(ChainParams::CreateMainNet()->GetConsensus().initialTarget == 0x1f0fffff);
}
