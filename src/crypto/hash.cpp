// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/hash.hpp"
#include "chain/endian.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace powledger {
namespace crypto {

void HashWriter::CtxDeleter::operator()(evp_md_ctx_st *ctx) const {
  EVP_MD_CTX_free(ctx);
}

HashWriter::HashWriter() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("HashWriter: EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_.get(), EVP_blake2s256(), nullptr) != 1) {
    throw std::runtime_error("HashWriter: BLAKE2s-256 digest unavailable");
  }
}

HashWriter::~HashWriter() = default;

HashWriter &HashWriter::WriteRaw(const uint8_t *data, size_t len) {
  if (finalized_) {
    throw std::logic_error("HashWriter: write after finalize");
  }
  if (len > 0 && EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
    throw std::runtime_error("HashWriter: EVP_DigestUpdate failed");
  }
  return *this;
}

HashWriter &HashWriter::WriteRaw(std::string_view data) {
  return WriteRaw(reinterpret_cast<const uint8_t *>(data.data()), data.size());
}

HashWriter &HashWriter::WriteU8(uint8_t value) { return WriteRaw(&value, 1); }

HashWriter &HashWriter::WriteU64(uint64_t value) {
  uint8_t buf[8];
  endian::WriteLE64(buf, value);
  return WriteRaw(buf, sizeof(buf));
}

HashWriter &HashWriter::WriteI64(int64_t value) {
  return WriteU64(static_cast<uint64_t>(value));
}

HashWriter &HashWriter::WriteU128(util::uint128_t value) {
  WriteU64(static_cast<uint64_t>(value));
  return WriteU64(static_cast<uint64_t>(value >> 64));
}

HashWriter &HashWriter::WriteString(std::string_view value) {
  WriteU64(value.size());
  return WriteRaw(value);
}

HashWriter &HashWriter::WriteBytes(std::span<const uint8_t> value) {
  WriteU64(value.size());
  return WriteRaw(value.data(), value.size());
}

HashWriter &HashWriter::WriteOptionalString(const std::optional<std::string> &value) {
  if (!value) {
    return WriteU8(0);
  }
  WriteU8(1);
  return WriteString(*value);
}

HashWriter::Digest HashWriter::Finalize() {
  if (finalized_) {
    throw std::logic_error("HashWriter: finalized twice");
  }
  Digest out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1 || len != OUTPUT_SIZE) {
    throw std::runtime_error("HashWriter: EVP_DigestFinal_ex failed");
  }
  finalized_ = true;
  return out;
}

std::string HashWriter::GetHex() {
  const Digest digest = Finalize();
  return HexStr(digest);
}

std::string HexStr(std::span<const uint8_t> bytes) {
  static constexpr char kHexDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(kHexDigits[b >> 4]);
    out.push_back(kHexDigits[b & 0x0f]);
  }
  return out;
}

} // namespace crypto
} // namespace powledger
