// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint128.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

// OpenSSL digest context (opaque)
struct evp_md_ctx_st;

namespace powledger {
namespace crypto {

/**
 * HashWriter - incremental Blake2s-256 content hasher
 *
 * Fields are fed through typed writers so every entity has exactly one
 * canonical encoding:
 *   - integers: fixed-width little-endian
 *   - strings / byte spans: u64 length prefix followed by the bytes
 *   - optionals: one tag byte (0 = absent, 1 = present) then the value
 * WriteRaw() appends bytes with no framing; it is used to fold already
 * fixed-length digests into a parent hash.
 *
 * Not thread-safe; one writer per hash computation.
 */
class HashWriter {
public:
  static constexpr size_t OUTPUT_SIZE = 32;
  using Digest = std::array<uint8_t, OUTPUT_SIZE>;

  // Throws std::runtime_error if the OpenSSL digest cannot be initialized
  HashWriter();
  ~HashWriter();

  HashWriter(const HashWriter &) = delete;
  HashWriter &operator=(const HashWriter &) = delete;

  HashWriter &WriteRaw(const uint8_t *data, size_t len);
  HashWriter &WriteRaw(std::string_view data);

  HashWriter &WriteU8(uint8_t value);
  HashWriter &WriteU64(uint64_t value);
  HashWriter &WriteI64(int64_t value);
  HashWriter &WriteU128(util::uint128_t value);
  HashWriter &WriteString(std::string_view value);
  HashWriter &WriteBytes(std::span<const uint8_t> value);
  HashWriter &WriteOptionalString(const std::optional<std::string> &value);

  // Finalize the digest. The writer must not be used afterwards.
  Digest Finalize();

  // Finalize and return the 64-char lowercase hex encoding
  std::string GetHex();

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st *ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
  bool finalized_{false};
};

// Lowercase hex encoding of a byte span
std::string HexStr(std::span<const uint8_t> bytes);

} // namespace crypto
} // namespace powledger
