// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace powledger {
namespace crypto {

// Ed25519 key and signature sizes (RFC 8032)
static constexpr size_t PUBLIC_KEY_SIZE = 32;
static constexpr size_t SIGNATURE_SIZE = 64;

using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;
using Signature = std::array<uint8_t, SIGNATURE_SIZE>;

// Verify an Ed25519 signature over `message`.
// Malformed keys verify as false; this never throws for bad input.
bool VerifySignature(const PublicKey &public_key, std::string_view message,
                     const Signature &signature);

} // namespace crypto
} // namespace powledger
