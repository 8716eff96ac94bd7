// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
//
// Simple single-threaded CPU miner
// Mines caller-built blocks for tests and local chains; not tuned for
// throughput.

#include "chain/miner.hpp"
#include "chain/blockchain.hpp"
#include "chain/pow.hpp"
#include "chain/validation.hpp"
#include "util/logging.hpp"

namespace powledger {
namespace mining {

CPUMiner::CPUMiner(validation::Blockchain &blockchain) : blockchain_(blockchain) {}

CPUMiner::~CPUMiner() { Stop(); }

bool CPUMiner::Start(chain::Block block) {
  // Atomically check and set mining_ flag to prevent race condition
  // If two threads call Start() simultaneously, only one will succeed
  bool expected = false;
  if (!mining_.compare_exchange_strong(expected, true)) {
    LOG_MINING_WARN("Miner: Already mining");
    return false;
  }

  std::lock_guard<std::mutex> lock(stop_mutex_);

  // Join any previous thread if it finished
  if (worker_.joinable()) {
    worker_.join();
  }

  interrupt_.store(false);
  total_hashes_.store(0);
  {
    std::lock_guard<std::mutex> result_lock(result_mutex_);
    last_accepted_ = false;
    last_reject_reason_.clear();
  }
  {
    std::lock_guard<std::mutex> time_lock(time_mutex_);
    start_time_ = std::chrono::steady_clock::now();
  }

  LOG_MINING_TRACE("Miner: Starting on block with {} txs, prev={}",
                   block.GetTransactions().size(),
                   block.GetPrevHash().value_or("none").substr(0, 16));

  worker_ = std::thread([this, block = std::move(block)]() mutable {
    MiningWorker(std::move(block));
  });
  return true;
}

void CPUMiner::Stop() {
  interrupt_.store(true);

  // Use mutex to ensure only one thread can join the worker at a time
  std::lock_guard<std::mutex> lock(stop_mutex_);

  // ALWAYS join the thread if it exists
  // Even if mining_ was already false, the thread might still be exiting!
  if (worker_.joinable()) {
    worker_.join();

    int64_t elapsed;
    {
      std::lock_guard<std::mutex> time_lock(time_mutex_);
      elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                    std::chrono::steady_clock::now() - start_time_)
                    .count();
    }

    LOG_MINING_TRACE("Miner: Stopped (hashes={} time={}s blocks_found={})",
                     total_hashes_.load(), elapsed, blocks_found_.load());
  }
}

bool CPUMiner::Wait() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  std::lock_guard<std::mutex> result_lock(result_mutex_);
  return last_accepted_;
}

double CPUMiner::GetHashrate() const {
  if (!mining_.load()) {
    return 0.0;
  }

  int64_t elapsed;
  {
    std::lock_guard<std::mutex> lock(time_mutex_);
    elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                  std::chrono::steady_clock::now() - start_time_)
                  .count();
  }

  if (elapsed == 0) {
    return 0.0;
  }

  return (double)total_hashes_.load() / elapsed;
}

std::string CPUMiner::GetLastRejectReason() const {
  std::lock_guard<std::mutex> lock(result_mutex_);
  return last_reject_reason_;
}

void CPUMiner::MiningWorker(chain::Block block) {
  const uint32_t target = blockchain_.GetNextTarget();
  LOG_MINING_TRACE("Miner: Target 0x{}", consensus::FormatTarget(target));

  uint64_t attempts = 0;
  while (!consensus::CheckProofOfWork(block.GetHash(), target)) {
    if (interrupt_.load()) {
      LOG_MINING_TRACE("Miner: Interrupted after {} hashes", attempts);
      FinishSession(false, "interrupted");
      return;
    }

    // Give up early if another block was appended in the meantime
    if (++attempts % TIP_CHECK_INTERVAL == 0 && IsStale(block.GetPrevHash())) {
      LOG_MINING_INFO("Miner: Chain tip changed, abandoning block");
      FinishSession(false, "stale-prevblk");
      return;
    }

    block.SetNonce(block.GetNonce() + 1);
    total_hashes_.fetch_add(1);
  }
  total_hashes_.fetch_add(1);
  blocks_found_.fetch_add(1);

  const std::string hash = block.GetHash();
  LOG_MINING_INFO("Miner: *** BLOCK FOUND *** Nonce: {}, Hash: {}", block.GetNonce(),
                  hash.substr(0, 16));

  if (IsStale(block.GetPrevHash())) {
    FinishSession(false, "stale-prevblk");
    return;
  }

  validation::BlockValidationState state;
  if (!blockchain_.AppendBlock(std::move(block), state)) {
    LOG_MINING_WARN("Miner: Mined block rejected: {}", state.ToString());
    FinishSession(false, state.GetRejectReason());
    return;
  }

  FinishSession(true, "");
}

bool CPUMiner::IsStale(const std::optional<chain::BlockHash> &prev_hash) const {
  return blockchain_.GetLastBlockHash() != prev_hash;
}

void CPUMiner::FinishSession(bool accepted, const std::string &reject_reason) {
  {
    std::lock_guard<std::mutex> lock(result_mutex_);
    last_accepted_ = accepted;
    last_reject_reason_ = reject_reason;
  }
  mining_.store(false);
}

} // namespace mining
} // namespace powledger
