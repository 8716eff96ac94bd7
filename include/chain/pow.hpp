// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace powledger {

// Forward declarations
namespace chain {
class ChainParams;
} // namespace chain

namespace consensus {

// Compact targets:
// A target is a 4-byte "bits" value, one exponent byte followed by a 3-byte
// coefficient. Block hashes are reduced to the same shape with
// GetCompactFromHash() and the two are compared as plain 32-bit integers;
// a block meets the target iff its compact value is strictly below it.

// Compact value of a lowercase hex hash. An all-zero hash yields 0.
uint32_t GetCompactFromHash(std::string_view hash);

// Parse a 1-8 digit hex target ("1f0fffff", "0x20ffffff").
// std::nullopt on malformed input.
std::optional<uint32_t> ParseTarget(const std::string &hex);

// 8 lowercase hex digits
std::string FormatTarget(uint32_t bits);

// CONSENSUS-CRITICAL: GetCompactFromHash(hash) < target
bool CheckProofOfWork(std::string_view hash, uint32_t target);

// Retargeting:
// difficulty = (last_time - first_time) / nExpectedInterval, clamped to
// [1/nMaxAdjust, nMaxAdjust]. The next target is the current target scaled
// by the difficulty and capped at maxTarget, so a chain that produced blocks
// faster than expected gets a smaller (harder) target.

double CalculateDifficulty(int64_t first_time, int64_t last_time,
                           const chain::ChainParams &params);

// Scale compact `target` by `difficulty` (16 bits of fractional precision),
// capped at `max_target`. Never returns a zero coefficient.
uint32_t ApplyDifficulty(uint32_t target, double difficulty, uint32_t max_target);

struct RetargetResult {
  uint32_t target;
  double difficulty;
};

// Target and difficulty for the next non-genesis block. With
// fPowNoRetargeting the current target is kept and difficulty is 1.0.
RetargetResult CalculateNextTarget(uint32_t current_target, int64_t first_time,
                                   int64_t last_time,
                                   const chain::ChainParams &params);

} // namespace consensus
} // namespace powledger
