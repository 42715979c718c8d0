/**
 * @file test_backend.cpp
 * @brief Unit tests for the libsecp256k1 and OpenSSL curve backends using Catch2.
 * @author Keytree Project
 * @date 2026
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "../include/hex.hpp"
#include "../include/openssl_backend.hpp"
#include "../include/secp256k1_backend.hpp"
#include "../include/xkeys.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace Keytree;

namespace {

    const std::string GENERATOR_HEX = "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";

    Bytes32 bytes32(const std::string& hex) {
        std::vector<uint8_t> raw = Hex::decode(hex);
        Bytes32 out{};
        std::copy(raw.begin(), raw.end(), out.begin());
        return out;
    }

    PointBytes pointBytes(const std::string& hex) {
        std::vector<uint8_t> raw = Hex::decode(hex);
        PointBytes out{};
        std::copy(raw.begin(), raw.end(), out.begin());
        return out;
    }

    Bytes32 one() {
        Bytes32 b{};
        b[31] = 1;
        return b;
    }

    Bytes32 orderMinusOne() {
        Bytes32 b = CurveBackend::ORDER;
        b[31] = 0x40;
        return b;
    }
}

TEST_CASE("Order comparison helpers", "[curve]") {
    REQUIRE(CurveBackend::isZero(Bytes32{}));
    REQUIRE_FALSE(CurveBackend::isZero(one()));
    REQUIRE(CurveBackend::isBelowOrder(Bytes32{}));
    REQUIRE(CurveBackend::isBelowOrder(orderMinusOne()));
    REQUIRE_FALSE(CurveBackend::isBelowOrder(CurveBackend::ORDER));

    Bytes32 allOnes;
    allOnes.fill(0xFF);
    REQUIRE_FALSE(CurveBackend::isBelowOrder(allOnes));
}

TEST_CASE("Curve backends agree on the group arithmetic", "[backend]") {
    BackendHandle backend = GENERATE(Secp256k1Backend::create(), OpensslBackend::create());
    INFO("backend: " << backend->name());

    SECTION("scalars must lie in [1, n-1]") {
        REQUIRE_THROWS_AS(backend->scalarFromBytes(Bytes32{}), InvalidKey);
        REQUIRE_THROWS_AS(backend->scalarFromBytes(CurveBackend::ORDER), InvalidKey);
        REQUIRE(backend->scalarFromBytes(orderMinusOne()).bytes() == orderMinusOne());
    }

    SECTION("1*G is the generator") {
        Point g = backend->scalarToPublicPoint(backend->scalarFromBytes(one()));
        REQUIRE(Hex::encode(g.bytes()) == GENERATOR_HEX);
        REQUIRE(backend->pointFromBytes(g.bytes()) == g);
    }

    SECTION("scalar tweak wraps modulo n") {
        Scalar k = backend->scalarFromBytes(one());
        REQUIRE_THROWS_AS(backend->tweakAddScalar(k, orderMinusOne()), InvalidKey);
        REQUIRE_THROWS_AS(backend->tweakAddScalar(k, CurveBackend::ORDER), InvalidKey);

        Scalar two = backend->tweakAddScalar(k, one());
        REQUIRE(two.bytes()[31] == 2);

        // (n-1) + 2 = 1 mod n
        Scalar wrapped = backend->tweakAddScalar(backend->scalarFromBytes(orderMinusOne()), two.bytes());
        REQUIRE(wrapped == k);
    }

    SECTION("zero tweak leaves the key unchanged") {
        Scalar k = backend->scalarFromBytes(one());
        REQUIRE(backend->tweakAddScalar(k, Bytes32{}) == k);

        Point g = backend->scalarToPublicPoint(k);
        REQUIRE(backend->tweakAddPoint(g, Bytes32{}) == g);
    }

    SECTION("point tweak matches scalar tweak") {
        Scalar k = backend->scalarFromBytes(one());
        Point g = backend->scalarToPublicPoint(k);
        Bytes32 tweak = bytes32("e8f32e723decf4051aefac8e2c93c9c5b214313817cdb01a1494b917c8436b35");

        REQUIRE(backend->tweakAddPoint(g, tweak)
                == backend->scalarToPublicPoint(backend->tweakAddScalar(k, tweak)));
    }

    SECTION("point tweak reaching the identity is rejected") {
        Point g = backend->scalarToPublicPoint(backend->scalarFromBytes(one()));
        REQUIRE_THROWS_AS(backend->tweakAddPoint(g, orderMinusOne()), InvalidKey);
        REQUIRE_THROWS_AS(backend->tweakAddPoint(g, CurveBackend::ORDER), InvalidKey);
    }

    SECTION("malformed points are rejected") {
        PointBytes uncompressedPrefix = pointBytes(GENERATOR_HEX);
        uncompressedPrefix[0] = 0x04;
        REQUIRE_THROWS_AS(backend->pointFromBytes(uncompressedPrefix), InvalidKey);

        // x >= p
        PointBytes offField = pointBytes("02fffffffffffffffffffffffffffffffffffffffffffffffffffffffefffffc2f");
        REQUIRE_THROWS_AS(backend->pointFromBytes(offField), InvalidKey);

        REQUIRE_THROWS_AS(backend->pointFromBytes(PointBytes{}), InvalidKey);
    }
}

TEST_CASE("Both backends derive identical BIP-32 trees", "[backend][xkeys]") {
    std::vector<uint8_t> seed = Hex::decode("000102030405060708090a0b0c0d0e0f");
    DerivationPath path = DerivationPath::parse("m/0'/1/2'/2/1000000000");

    XPriv viaSecp = XPriv::rootFromSeed(seed, Secp256k1Backend::create()).derivePrivatePath(path);
    XPriv viaOpenssl = XPriv::rootFromSeed(seed, OpensslBackend::create()).derivePrivatePath(path);

    REQUIRE(viaSecp == viaOpenssl);
    REQUIRE(Hex::encode(viaOpenssl.serialize())
            == "471b76e389e528d6de6d816857e012c5455051cad6660850e58372a6c3e6e7c8");
    REQUIRE(Hex::encode(viaOpenssl.publicPoint().bytes())
            == "022a471424da5e657499d1ff51cb43c47481a03b1e77f951fe64cec9f5a48f7011");

    XPub pubSecp = XPriv::rootFromSeed(seed, Secp256k1Backend::create())
                       .derivePrivatePath(DerivationPath::parse("m/0'/1/2'"))
                       .derivePublicKey()
                       .derivePublicPath(DerivationPath{2, 1000000000});
    XPub pubOpenssl = XPriv::rootFromSeed(seed, OpensslBackend::create())
                          .derivePrivatePath(DerivationPath::parse("m/0'/1/2'"))
                          .derivePublicKey()
                          .derivePublicPath(DerivationPath{2, 1000000000});

    REQUIRE(pubSecp == pubOpenssl);
    REQUIRE(pubOpenssl.publicPoint() == viaSecp.publicPoint());
}
