// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test suite for content hashing and signature verification

#include <catch2/catch_test_macros.hpp>
#include "crypto/hash.hpp"
#include "crypto/signature.hpp"
#include "test_keys.hpp"
#include <stdexcept>

using namespace powledger::crypto;
using powledger::test::TestKey;

TEST_CASE("Blake2s known answer", "[crypto][hash]") {
    // RFC 7693 Appendix B
    REQUIRE(HashWriter().WriteRaw("abc").GetHex() ==
            "508c5e8c327c14e2e1a72ba34eeb452f37458b209ed63a294d999b4c86675982");
}

TEST_CASE("HashWriter encoding", "[crypto][hash]") {
    SECTION("Output is 64 lowercase hex chars") {
        HashWriter w;
        w.WriteU64(42);
        std::string hex = w.GetHex();
        REQUIRE(hex.size() == 64);
        REQUIRE(hex.find_first_not_of("0123456789abcdef") == std::string::npos);
    }

    SECTION("Identical inputs give identical output") {
        HashWriter a;
        HashWriter b;
        a.WriteU64(7).WriteString("alice").WriteU128(100);
        b.WriteU64(7).WriteString("alice").WriteU128(100);
        REQUIRE(a.GetHex() == b.GetHex());
    }

    SECTION("Any field change changes the output") {
        HashWriter a;
        HashWriter b;
        a.WriteU64(7).WriteString("alice").WriteU128(100);
        b.WriteU64(7).WriteString("alice").WriteU128(101);
        REQUIRE(a.GetHex() != b.GetHex());
    }

    SECTION("Strings are length-prefixed") {
        HashWriter a;
        HashWriter b;
        a.WriteString("ab").WriteString("c");
        b.WriteString("a").WriteString("bc");
        REQUIRE(a.GetHex() != b.GetHex());
    }

    SECTION("Absent optional differs from empty string") {
        HashWriter a;
        HashWriter b;
        a.WriteOptionalString(std::nullopt);
        b.WriteOptionalString(std::string());
        REQUIRE(a.GetHex() != b.GetHex());
    }

    SECTION("128-bit values are two little-endian words") {
        const powledger::util::uint128_t value =
            (static_cast<powledger::util::uint128_t>(2) << 64) | 1;
        HashWriter a;
        HashWriter b;
        a.WriteU128(value);
        b.WriteU64(1).WriteU64(2);
        REQUIRE(a.GetHex() == b.GetHex());
    }

    SECTION("Signed and unsigned 64-bit share an encoding") {
        HashWriter a;
        HashWriter b;
        a.WriteI64(-1);
        b.WriteU64(UINT64_MAX);
        REQUIRE(a.GetHex() == b.GetHex());
    }

    SECTION("Write after finalize throws") {
        HashWriter w;
        w.WriteU8(1);
        (void)w.Finalize();
        REQUIRE_THROWS_AS(w.WriteU8(2), std::logic_error);
        REQUIRE_THROWS_AS(w.Finalize(), std::logic_error);
    }
}

TEST_CASE("HexStr", "[crypto][hash]") {
    const uint8_t bytes[] = {0x00, 0x0f, 0xa0, 0xff};
    REQUIRE(HexStr(bytes) == "000fa0ff");
    REQUIRE(HexStr({}) == "");
}

TEST_CASE("Ed25519 signature verification", "[crypto][signature]") {
    TestKey key;
    const std::string message = HashWriter().WriteRaw("payload").GetHex();
    const Signature sig = key.Sign(message);

    SECTION("Valid signature verifies") {
        REQUIRE(VerifySignature(key.GetPublicKey(), message, sig));
    }

    SECTION("Different message fails") {
        REQUIRE_FALSE(VerifySignature(key.GetPublicKey(), HashWriter().WriteRaw("other").GetHex(), sig));
    }

    SECTION("Different key fails") {
        TestKey other;
        REQUIRE_FALSE(VerifySignature(other.GetPublicKey(), message, sig));
    }

    SECTION("Flipped signature bit fails") {
        Signature bad = sig;
        bad[10] ^= 0x01;
        REQUIRE_FALSE(VerifySignature(key.GetPublicKey(), message, bad));
    }

    SECTION("Garbage key never throws") {
        PublicKey garbage;
        garbage.fill(0xff);
        REQUIRE_NOTHROW(VerifySignature(garbage, message, sig));
        REQUIRE_FALSE(VerifySignature(garbage, message, sig));
    }
}
