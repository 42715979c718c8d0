#ifndef HASH_HPP
#define HASH_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "curve.hpp"

/**
 * @file hash.hpp
 * @brief Hash primitives used by BIP-32: HMAC-SHA512 and HASH160 fingerprints.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /// First 4 bytes of HASH160 of a compressed public key.
    using KeyFingerprint = std::array<uint8_t, 4>;

    class Hash {
    public:
        using Digest512 = std::array<uint8_t, 64>;
        using Digest256 = std::array<uint8_t, 32>;
        using Digest160 = std::array<uint8_t, 20>;

        /// @throw CryptoException If OpenSSL fails.
        static Digest512 hmacSha512(const uint8_t* key, size_t keyLen, const uint8_t* data, size_t dataLen);

        /**
         * @brief HMAC-SHA512 split into its left and right 32-byte halves.
         *
         * BIP-32 uses the left half as a scalar (or tweak) and the right half
         * as the chain code. The intermediate 64-byte buffer is wiped.
         */
        static std::pair<Bytes32, Bytes32> hmacAndSplit(const uint8_t* key, size_t keyLen,
                                                        const uint8_t* data, size_t dataLen);

        static Digest256 sha256(const uint8_t* data, size_t len);
        static Digest160 ripemd160(const uint8_t* data, size_t len);

        /// RIPEMD160(SHA256(data))
        static Digest160 hash160(const uint8_t* data, size_t len);

        static KeyFingerprint fingerprint(const Point& point);

    private:
        Hash() = delete;
    };

} // namespace Keytree

#endif // HASH_HPP
