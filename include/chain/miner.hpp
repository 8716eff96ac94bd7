// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace powledger {

// Forward declarations
namespace validation {
class Blockchain;
}

namespace mining {

// CPU Miner - mines one caller-built block on a background thread and
// submits it to the Blockchain. Single worker; atomics for cross-thread
// queries.
//
// The block is mined against Blockchain::GetNextTarget(), the target the
// chain will gate it on. Hashing never holds the Blockchain lock.

class CPUMiner {
public:
  explicit CPUMiner(validation::Blockchain &blockchain);
  ~CPUMiner();

  CPUMiner(const CPUMiner &) = delete;
  CPUMiner &operator=(const CPUMiner &) = delete;

  // Start mining `block`. Returns false if a session is already running.
  bool Start(chain::Block block);

  // Interrupt the worker and join it. Safe to call repeatedly or from
  // several threads.
  void Stop();

  // Join the worker without interrupting it. True iff the session's block
  // was found and accepted by the Blockchain.
  bool Wait();

  bool IsMining() const { return mining_.load(); }
  double GetHashrate() const;
  uint64_t GetTotalHashes() const { return total_hashes_.load(); }
  int GetBlocksFound() const { return blocks_found_.load(); }

  // Reject reason of the last session ("" when accepted or still running)
  std::string GetLastRejectReason() const;

  // How many nonces are tried between checks that the chain tip is unchanged
  static constexpr uint64_t TIP_CHECK_INTERVAL = 4096;

private:
  void MiningWorker(chain::Block block);

  // True if the chain tip moved away from `prev_hash`
  bool IsStale(const std::optional<chain::BlockHash> &prev_hash) const;

  void FinishSession(bool accepted, const std::string &reject_reason);

  validation::Blockchain &blockchain_;

  // Mining state (atomics for cross-thread access)
  std::atomic<bool> mining_{false};
  std::atomic<bool> interrupt_{false};
  std::atomic<uint64_t> total_hashes_{0};
  std::atomic<int> blocks_found_{0};

  // Session result, protected by result_mutex_
  bool last_accepted_{false};
  std::string last_reject_reason_;
  mutable std::mutex result_mutex_;

  // Mining timing (for hashrate calculation)
  std::chrono::steady_clock::time_point start_time_;
  mutable std::mutex time_mutex_; // Protects start_time_ from concurrent access

  // Mining thread
  std::thread worker_;
  mutable std::mutex stop_mutex_; // Protects Stop()/Wait() from concurrent joins
};

} // namespace mining
} // namespace powledger
