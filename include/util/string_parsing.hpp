#pragma once

/*
 String Parsing Utilities

 Safe parsing of untrusted hex strings (block hashes, compact targets).
 - Parsers require the entire input to be consumed
 - Nothing throws; parse failures return std::nullopt
*/

#include "util/uint128.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace powledger {
namespace util {

/**
 * Validate hexadecimal string
 *
 *   IsValidHex("deadbeef") -> true
 *   IsValidHex("xyz") -> false
 *   IsValidHex("") -> false
 */
bool IsValidHex(const std::string& str);

/**
 * Parse a hex string into a 32-bit unsigned value
 *
 * Accepts 1-8 hex digits with an optional "0x" prefix.
 *
 *   SafeParseHex32("1f0fffff") -> 0x1f0fffff
 *   SafeParseHex32("0x20ffffff") -> 0x20ffffff
 *   SafeParseHex32("123456789") -> std::nullopt (too long)
 */
std::optional<uint32_t> SafeParseHex32(const std::string& str);

// Decimal representation of an unsigned 128-bit value
std::string FormatU128(uint128_t value);

} // namespace util
} // namespace powledger
