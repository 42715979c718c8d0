#include "../include/hash.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>

/**
 * @file hash.cpp
 * @brief OpenSSL-backed hash primitives.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    namespace {

        template <std::size_t N>
        std::array<uint8_t, N> digest(const EVP_MD* md, const uint8_t* data, size_t len, const char* what) {
            std::array<uint8_t, N> out;
            unsigned int outLen = 0;
            if (!md || EVP_Digest(data, len, out.data(), &outLen, md, nullptr) != 1 || outLen != N) {
                throw CryptoException(std::string(what) + " computation failed");
            }
            return out;
        }
    }

    Hash::Digest512 Hash::hmacSha512(const uint8_t* key, size_t keyLen, const uint8_t* data, size_t dataLen) {
        Digest512 I;
        unsigned int I_len = 0;

        if (HMAC(EVP_sha512(), key, static_cast<int>(keyLen), data, dataLen, I.data(), &I_len) == nullptr
            || I_len != I.size()) {
            secure_memzero(I.data(), I.size());
            throw CryptoException("HMAC-SHA512 computation failed");
        }

        return I;
    }

    std::pair<Bytes32, Bytes32> Hash::hmacAndSplit(const uint8_t* key, size_t keyLen,
                                                   const uint8_t* data, size_t dataLen) {
        Digest512 I = hmacSha512(key, keyLen, data, dataLen);

        std::pair<Bytes32, Bytes32> halves;
        std::copy(I.begin(), I.begin() + 32, halves.first.begin());
        std::copy(I.begin() + 32, I.end(), halves.second.begin());

        secure_memzero(I.data(), I.size());
        return halves;
    }

    Hash::Digest256 Hash::sha256(const uint8_t* data, size_t len) {
        return digest<32>(EVP_sha256(), data, len, "SHA-256");
    }

    Hash::Digest160 Hash::ripemd160(const uint8_t* data, size_t len) {
        return digest<20>(EVP_ripemd160(), data, len, "RIPEMD-160");
    }

    Hash::Digest160 Hash::hash160(const uint8_t* data, size_t len) {
        Digest256 inner = sha256(data, len);
        return ripemd160(inner.data(), inner.size());
    }

    KeyFingerprint Hash::fingerprint(const Point& point) {
        Digest160 id = hash160(point.bytes().data(), point.bytes().size());

        KeyFingerprint fp;
        std::copy(id.begin(), id.begin() + fp.size(), fp.begin());
        return fp;
    }

} // namespace Keytree
