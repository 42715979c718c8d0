/**
 * @file test_keys.cpp
 * @brief Unit tests for Keytree::PrivateKey / Keytree::PublicKey and hashing helpers using Catch2.
 * @author Keytree Project
 * @date 2026
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "../include/hash.hpp"
#include "../include/hex.hpp"
#include "../include/keys.hpp"
#include "../include/openssl_backend.hpp"
#include "../include/secp256k1_backend.hpp"
#include "../include/secure_memory.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Keytree;

namespace {

    // BIP-32 Vector 1 master key
    const std::string MASTER_PRV = "e8f32e723decf4051aefac8e2c93c9c5b214313817cdb01a1494b917c8436b35";
    const std::string MASTER_PUB = "0339a36013301597daef41fbe593a02cc513d0b55527ec2df1050e2e8ff49c85c2";
    const std::string MASTER_FPR = "3442193e";

    template <typename A>
    A fromHex(const std::string& hex) {
        std::vector<uint8_t> raw = Hex::decode(hex);
        A out{};
        std::copy(raw.begin(), raw.end(), out.begin());
        return out;
    }
}

TEST_CASE("Hex encoding and decoding", "[hex]") {
    std::vector<uint8_t> bytes = Hex::decode("00ff10Ab");
    const std::vector<uint8_t> expected = {0x00, 0xFF, 0x10, 0xAB};
    REQUIRE(bytes == expected);
    REQUIRE(Hex::encode(bytes) == "00ff10ab");
    REQUIRE(Hex::decode("").empty());

    REQUIRE_THROWS_AS(Hex::decode("abc"), std::invalid_argument);
    REQUIRE_THROWS_AS(Hex::decode("zz"), std::invalid_argument);
}

TEST_CASE("Hex::decode into wiped memory", "[hex]") {
    SecureBytes seed = Hex::decode<SecureBytes>("000102030405060708090a0b0c0d0e0f");
    REQUIRE(seed.size() == 16);
    REQUIRE(seed.front() == 0x00);
    REQUIRE(seed.back() == 0x0f);

    try {
        Hex::decode<SecureBytes>("0001secret");
        FAIL("expected std::invalid_argument");
    } catch (const std::invalid_argument& e) {
        REQUIRE(std::string(e.what()).find("secret") == std::string::npos);
    }
}

TEST_CASE("Hash primitives match known digests", "[hash]") {
    const std::string abc = "abc";
    const uint8_t* data = reinterpret_cast<const uint8_t*>(abc.data());

    REQUIRE(Hex::encode(Hash::sha256(data, abc.size()))
            == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(Hex::encode(Hash::ripemd160(data, abc.size()))
            == "8eb208f7e05d987a9b044a8e98c6b087f15a0bfc");

    // RFC 4231 test case 2
    const std::string key = "Jefe";
    const std::string msg = "what do ya want for nothing?";
    auto mac = Hash::hmacSha512(reinterpret_cast<const uint8_t*>(key.data()), key.size(),
                                reinterpret_cast<const uint8_t*>(msg.data()), msg.size());
    REQUIRE(Hex::encode(mac) ==
            "164b7a7bfcf819e2e395fbe73b56e0a387bd64222e831fd610270cd7ea250554"
            "9758bf75c05a994a6d034f65f8f0e6fdcaeab1a34d4a6b4b636e070a38bce737");

    auto halves = Hash::hmacAndSplit(reinterpret_cast<const uint8_t*>(key.data()), key.size(),
                                     reinterpret_cast<const uint8_t*>(msg.data()), msg.size());
    REQUIRE(Hex::encode(halves.first) == "164b7a7bfcf819e2e395fbe73b56e0a387bd64222e831fd610270cd7ea250554");
    REQUIRE(Hex::encode(halves.second) == "9758bf75c05a994a6d034f65f8f0e6fdcaeab1a34d4a6b4b636e070a38bce737");
}

TEST_CASE("PrivateKey::fromBytes validates through the backend", "[keys]") {
    BackendHandle backend = Secp256k1Backend::create();

    PrivateKey key = PrivateKey::fromBytes(fromHex<Bytes32>(MASTER_PRV), backend);
    REQUIRE(Hex::encode(key.serialize()) == MASTER_PRV);
    REQUIRE(Hex::encode(key.publicPoint().bytes()) == MASTER_PUB);
    REQUIRE(Hex::encode(key.fingerprint()) == MASTER_FPR);

    REQUIRE_THROWS_AS(PrivateKey::fromBytes(Bytes32{}, backend), InvalidKey);
    REQUIRE_THROWS_AS(PrivateKey::fromBytes(CurveBackend::ORDER, backend), InvalidKey);
    REQUIRE_THROWS_AS(PrivateKey::fromBytes(fromHex<Bytes32>(MASTER_PRV), nullptr), NoBackend);
}

TEST_CASE("PrivateKey::derivePublicKey is stable", "[keys]") {
    BackendHandle backend = Secp256k1Backend::create();
    PrivateKey key = PrivateKey::fromBytes(fromHex<Bytes32>(MASTER_PRV), backend);

    PublicKey first = key.derivePublicKey();
    PublicKey second = key.derivePublicKey();

    REQUIRE(first == second);
    REQUIRE(first.publicPoint() == key.publicPoint());
    REQUIRE(first.fingerprint() == key.fingerprint());
    REQUIRE(first.backend() == backend);
}

TEST_CASE("PublicKey::fromBytes parses compressed points", "[keys]") {
    BackendHandle backend = OpensslBackend::create();

    PublicKey key = PublicKey::fromBytes(fromHex<PointBytes>(MASTER_PUB), backend);
    REQUIRE(Hex::encode(key.serialize()) == MASTER_PUB);
    REQUIRE(Hex::encode(key.fingerprint()) == MASTER_FPR);

    PointBytes bad = fromHex<PointBytes>(MASTER_PUB);
    bad[0] = 0x05;
    REQUIRE_THROWS_AS(PublicKey::fromBytes(bad, backend), InvalidKey);
    REQUIRE_THROWS_AS(PublicKey::fromBytes(fromHex<PointBytes>(MASTER_PUB), nullptr), NoBackend);
}

TEST_CASE("Keys without a backend only fail when curve arithmetic is needed", "[keys]") {
    PrivateKey attached = PrivateKey::fromBytes(fromHex<Bytes32>(MASTER_PRV), Secp256k1Backend::create());
    PrivateKey detached(attached.scalar());

    REQUIRE(detached.backend() == nullptr);
    REQUIRE(Hex::encode(detached.serialize()) == MASTER_PRV);
    REQUIRE_THROWS_AS(detached.publicPoint(), NoBackend);
    REQUIRE_THROWS_AS(detached.derivePublicKey(), NoBackend);
    REQUIRE_THROWS_AS(detached.requireBackend(), NoBackend);

    PublicKey detachedPub(attached.publicPoint());
    REQUIRE(Hex::encode(detachedPub.fingerprint()) == MASTER_FPR);
    REQUIRE_THROWS_AS(detachedPub.requireBackend(), NoBackend);
}

TEST_CASE("Key equality ignores the backend", "[keys]") {
    Bytes32 raw = fromHex<Bytes32>(MASTER_PRV);
    PrivateKey viaSecp = PrivateKey::fromBytes(raw, Secp256k1Backend::create());
    PrivateKey viaOpenssl = PrivateKey::fromBytes(raw, OpensslBackend::create());

    REQUIRE(viaSecp == viaOpenssl);
    REQUIRE(viaSecp == PrivateKey(viaSecp.scalar()));
    REQUIRE(viaSecp.derivePublicKey() == viaOpenssl.derivePublicKey());

    Bytes32 other = raw;
    other[31] ^= 0x01;
    REQUIRE(viaSecp != PrivateKey::fromBytes(other, viaSecp.backend()));
}
