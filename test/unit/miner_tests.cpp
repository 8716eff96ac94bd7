// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test suite for CPUMiner session handling

#include <catch2/catch_test_macros.hpp>
#include "chain/blockchain.hpp"
#include "chain/chainparams.hpp"
#include "chain/miner.hpp"
#include "test_blockchain.hpp"
#include "test_keys.hpp"
#include <memory>

using namespace powledger;
using namespace powledger::chain;
using namespace powledger::mining;
using namespace powledger::validation;
using namespace powledger::test;

namespace {

class MinerTestFixture {
public:
    // A zero target can never be met, so sessions run until interrupted
    explicit MinerTestFixture(bool unreachable_target) {
        params = ChainParams::CreateRegTest();
        if (unreachable_target) {
            params->SetInitialTarget(0);
        }
        blockchain = std::make_unique<Blockchain>(*params);
        miner = std::make_unique<CPUMiner>(*blockchain);
    }

    ~MinerTestFixture() {
        if (miner) {
            miner->Stop();
        }
    }

    Block GenesisCandidate() {
        return BuildBlock(*blockchain, {MakeCreateAccount("satoshi", key)});
    }

    std::unique_ptr<ChainParams> params;
    std::unique_ptr<Blockchain> blockchain;
    std::unique_ptr<CPUMiner> miner;
    TestKey key;
};

} // namespace

TEST_CASE("CPUMiner initial state", "[miner]") {
    MinerTestFixture f(false);

    REQUIRE_FALSE(f.miner->IsMining());
    REQUIRE(f.miner->GetHashrate() == 0.0);
    REQUIRE(f.miner->GetTotalHashes() == 0);
    REQUIRE(f.miner->GetBlocksFound() == 0);
    REQUIRE(f.miner->GetLastRejectReason().empty());
}

TEST_CASE("CPUMiner mines and submits a block", "[miner]") {
    MinerTestFixture f(false);

    REQUIRE(f.miner->Start(f.GenesisCandidate()));
    REQUIRE(f.miner->Wait());

    REQUIRE_FALSE(f.miner->IsMining());
    REQUIRE(f.miner->GetBlocksFound() == 1);
    REQUIRE(f.miner->GetTotalHashes() >= 1);
    REQUIRE(f.miner->GetLastRejectReason().empty());

    REQUIRE(f.blockchain->GetHeight() == 0);
    REQUIRE(f.blockchain->GetAccount("satoshi").has_value());

    SECTION("Next session builds on the new tip") {
        REQUIRE(f.miner->Start(BuildBlock(*f.blockchain, {MakeCreateAccount("alice", f.key)})));
        REQUIRE(f.miner->Wait());
        REQUIRE(f.blockchain->GetHeight() == 1);
        REQUIRE(f.miner->GetBlocksFound() == 2);

        BlockValidationState state;
        REQUIRE(f.blockchain->Validate(state));
    }
}

TEST_CASE("CPUMiner reports rejected blocks", "[miner]") {
    MinerTestFixture f(false);

    // Valid proof of work, but the account already exists
    REQUIRE(MineAndAppend(*f.blockchain, f.GenesisCandidate()));
    REQUIRE(f.miner->Start(BuildBlock(*f.blockchain, {MakeCreateAccount("satoshi", f.key)})));
    REQUIRE_FALSE(f.miner->Wait());

    REQUIRE(f.miner->GetBlocksFound() == 1);
    REQUIRE(f.miner->GetLastRejectReason() == "bad-tx-account-exists");
    REQUIRE(f.blockchain->GetHeight() == 0);
}

TEST_CASE("CPUMiner start/stop", "[miner]") {
    MinerTestFixture f(true);

    REQUIRE(f.miner->Start(f.GenesisCandidate()));
    REQUIRE(f.miner->IsMining());

    SECTION("Double start is refused") {
        REQUIRE_FALSE(f.miner->Start(f.GenesisCandidate()));
        REQUIRE(f.miner->IsMining());
    }

    SECTION("Stop interrupts the session") {
        f.miner->Stop();
        REQUIRE_FALSE(f.miner->IsMining());
        REQUIRE(f.miner->GetLastRejectReason() == "interrupted");
        REQUIRE_FALSE(f.miner->Wait());
        REQUIRE(f.miner->GetBlocksFound() == 0);
        REQUIRE(f.blockchain->GetHeight() == -1);

        // Idempotent
        f.miner->Stop();
        REQUIRE_FALSE(f.miner->IsMining());
    }

    SECTION("Restart after stop") {
        f.miner->Stop();
        REQUIRE(f.miner->Start(f.GenesisCandidate()));
        REQUIRE(f.miner->IsMining());
        f.miner->Stop();
        REQUIRE_FALSE(f.miner->IsMining());
    }
}

TEST_CASE("CPUMiner abandons a stale block", "[miner]") {
    MinerTestFixture f(true);

    REQUIRE(f.miner->Start(f.GenesisCandidate()));

    // Genesis is not gated on proof of work, so it lands despite the target
    Block genesis = f.GenesisCandidate();
    BlockValidationState state;
    REQUIRE(f.blockchain->AppendBlock(genesis, state));

    REQUIRE_FALSE(f.miner->Wait());
    REQUIRE(f.miner->GetLastRejectReason() == "stale-prevblk");
    REQUIRE(f.miner->GetTotalHashes() >= CPUMiner::TIP_CHECK_INTERVAL - 1);
    REQUIRE(f.blockchain->GetHeight() == 0);
}
