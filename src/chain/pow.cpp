// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/pow.hpp"
#include "chain/chainparams.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace powledger {
namespace consensus {

namespace {
// Fixed-point scale applied to the difficulty multiplier
constexpr int FRACTION_BITS = 16;
constexpr uint64_t MAX_COEFFICIENT = 0xffffff;
} // namespace

/**
 * Reduce a hex hash to compact form
 *
 * 1. Drop leading '0' characters.
 * 2. While the first six characters end in '0', prepend a '0'. This slides
 *    the significant digits to the end of the 6-char coefficient window.
 * 3. Pad to an even length; exponent = length / 2 (bytes).
 * 4. Coefficient = first six characters.
 *
 * A remainder shorter than six characters is left-padded to six first so
 * the window is always defined.
 */
uint32_t GetCompactFromHash(std::string_view hash) {
  if (!util::IsValidHex(std::string(hash))) {
    // Not a hex hash; compare as the largest possible value so it never
    // satisfies a target
    LOG_CHAIN_WARN("GetCompactFromHash: malformed hash '{}'", std::string(hash));
    return UINT32_MAX;
  }

  const size_t first = hash.find_first_not_of('0');
  if (first == std::string_view::npos) {
    return 0;
  }

  std::string digits(hash.substr(first));
  if (digits.size() < 6) {
    digits.insert(0, 6 - digits.size(), '0');
  }
  while (digits[5] == '0') {
    digits.insert(digits.begin(), '0');
  }
  if (digits.size() % 2 != 0) {
    digits.insert(digits.begin(), '0');
  }

  const size_t exponent = digits.size() / 2;
  auto coefficient = util::SafeParseHex32(digits.substr(0, 6));
  if (!coefficient || exponent > 0xff) {
    LOG_CHAIN_WARN("GetCompactFromHash: hash too long ({} chars)", hash.size());
    return UINT32_MAX;
  }

  return (static_cast<uint32_t>(exponent) << 24) | *coefficient;
}

std::optional<uint32_t> ParseTarget(const std::string &hex) {
  return util::SafeParseHex32(hex);
}

std::string FormatTarget(uint32_t bits) {
  std::ostringstream s;
  s << std::hex << std::setw(8) << std::setfill('0') << bits;
  return s.str();
}

bool CheckProofOfWork(std::string_view hash, uint32_t target) {
  return GetCompactFromHash(hash) < target;
}

double CalculateDifficulty(int64_t first_time, int64_t last_time,
                           const chain::ChainParams &params) {
  const auto &consensus = params.GetConsensus();
  const double max_adjust = static_cast<double>(consensus.nMaxAdjust);

  if (consensus.nExpectedInterval <= 0 || max_adjust < 1.0) {
    // Invalid consensus parameters; leave the target where it is
    LOG_CHAIN_ERROR("CalculateDifficulty: invalid params interval={} max_adjust={}",
                    consensus.nExpectedInterval, consensus.nMaxAdjust);
    return 1.0;
  }

  // A clock that went backwards counts as zero elapsed time
  const int64_t elapsed = std::max<int64_t>(last_time - first_time, 0);
  const double raw = static_cast<double>(elapsed) /
                     static_cast<double>(consensus.nExpectedInterval);

  return std::clamp(raw, 1.0 / max_adjust, max_adjust);
}

/**
 * Multiply a compact target by `difficulty`
 *
 * value(bits) = coefficient * 256^(exponent - 3). The difficulty is taken as
 * a 16.16 fixed-point factor, so
 *   value' = coefficient * factor * 256^(exponent - 5)
 * and the product is renormalized back into a 3-byte coefficient.
 */
uint32_t ApplyDifficulty(uint32_t target, double difficulty, uint32_t max_target) {
  const int exponent = static_cast<int>(target >> 24);
  const uint64_t coefficient = target & MAX_COEFFICIENT;

  if (!(difficulty > 0.0) || !std::isfinite(difficulty)) {
    return std::min(target, max_target);
  }

  const double scaled = std::ldexp(difficulty, FRACTION_BITS);
  if (scaled >= static_cast<double>(UINT32_MAX)) {
    return max_target;
  }
  const auto factor = static_cast<uint64_t>(std::llround(scaled));

  // coefficient < 2^24 and factor < 2^32, so the product fits
  uint64_t product = coefficient * factor;
  int shift = exponent - 5;
  while (product > MAX_COEFFICIENT) {
    product >>= 8;
    ++shift;
  }
  while (shift < -3) {
    // Exponent would go negative; fold the excess into the coefficient
    product >>= 8;
    ++shift;
  }

  const int new_exponent = shift + 3;
  if (new_exponent > 0xff) {
    return max_target;
  }
  if (product == 0) {
    product = 1;
  }

  const uint32_t result = (static_cast<uint32_t>(new_exponent) << 24) |
                          static_cast<uint32_t>(product);
  return std::min(result, max_target);
}

RetargetResult CalculateNextTarget(uint32_t current_target, int64_t first_time,
                                   int64_t last_time,
                                   const chain::ChainParams &params) {
  const auto &consensus = params.GetConsensus();

  if (consensus.fPowNoRetargeting) {
    LOG_CHAIN_TRACE("CalculateNextTarget: retargeting disabled, keeping bits={:#x}",
                    current_target);
    return {current_target, 1.0};
  }

  const double difficulty = CalculateDifficulty(first_time, last_time, params);
  const uint32_t next = ApplyDifficulty(current_target, difficulty, consensus.maxTarget);

  LOG_CHAIN_TRACE("CalculateNextTarget: elapsed={}s difficulty={:.4f} bits {:#x} -> {:#x}",
                  last_time - first_time, difficulty, current_target, next);
  return {next, difficulty};
}

} // namespace consensus
} // namespace powledger
