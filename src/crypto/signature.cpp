// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/signature.hpp"
#include "util/logging.hpp"
#include <memory>
#include <openssl/evp.h>

namespace powledger {
namespace crypto {

namespace {
struct PKeyDeleter {
  void operator()(EVP_PKEY *pkey) const { EVP_PKEY_free(pkey); }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
} // namespace

bool VerifySignature(const PublicKey &public_key, std::string_view message,
                     const Signature &signature) {
  std::unique_ptr<EVP_PKEY, PKeyDeleter> pkey(EVP_PKEY_new_raw_public_key(
      EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
  if (!pkey) {
    LOG_CRYPTO_DEBUG("VerifySignature: rejected malformed Ed25519 public key");
    return false;
  }

  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    LOG_CRYPTO_ERROR("VerifySignature: EVP_MD_CTX_new failed");
    return false;
  }

  // Ed25519 is a one-shot scheme: no digest type, message passed whole
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
    LOG_CRYPTO_ERROR("VerifySignature: EVP_DigestVerifyInit failed");
    return false;
  }

  const int rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                                  reinterpret_cast<const unsigned char *>(message.data()),
                                  message.size());
  return rc == 1;
}

} // namespace crypto
} // namespace powledger
