#ifndef XKEYS_HPP
#define XKEYS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "exceptions.hpp"
#include "keys.hpp"
#include "path.hpp"

/**
 * @file xkeys.hpp
 * @brief BIP-32 extended keys: master node generation and child key derivation.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    using ChainCode = std::array<uint8_t, 32>;

    /**
     * @brief Address family the key is meant for (xpub/ypub/zpub in BIP-32
     * string form). Carried through derivation unchanged, never used by it.
     */
    enum class Hint { Legacy, Compatibility, SegWit };

    std::string hintToString(Hint hint);

    /// @throw std::invalid_argument On a name other than legacy, compatibility or segwit.
    Hint hintFromString(const std::string& name);

    /**
     * @brief HD metadata shared by extended private and public keys.
     */
    struct XKeyInfo {
        uint8_t depth = 0;          // number of ancestors, 0 for the master node
        KeyFingerprint parent{};    // fingerprint of the parent, zero for the master node
        uint32_t index = 0;         // child index that produced this key, hardened bit included
        ChainCode chainCode{};      // entropy (c)
        Hint hint = Hint::SegWit;

        bool operator==(const XKeyInfo& other) const {
            return depth == other.depth && parent == other.parent && index == other.index
                && chainCode == other.chainCode && hint == other.hint;
        }
        bool operator!=(const XKeyInfo& other) const { return !(*this == other); }
    };

    class XPub;

    /**
     * @class XPriv
     * @brief Extended private key. Immutable; every derivation returns a new key.
     */
    class XPriv {
    public:
        using VerifyingKey = XPub;

        /// @brief HMAC key defined by BIP-32 for master node generation.
        static constexpr const char* BIP32_HMAC_KEY = "Bitcoin seed";

        /// @brief Shortest accepted seed, 128 bits.
        static constexpr std::size_t MIN_SEED_BYTES = 16;

        XPriv(const XKeyInfo& info, PrivateKey key);

        /**
         * @brief Derives a master node with a caller-supplied HMAC key.
         *
         * I = HMAC-SHA512(Key = hmacKey, Data = seed); the left half is the
         * master scalar and the right half the master chain code.
         *
         * @throw SeedTooShort If the seed is shorter than 16 bytes.
         * @throw InvalidKey If the left half is zero or not below the group order.
         * @throw NoBackend If @p backend is null.
         */
        static XPriv customMasterNode(const uint8_t* hmacKey, size_t hmacKeyLen,
                                      const uint8_t* seed, size_t seedLen,
                                      BackendHandle backend, Hint hint = Hint::SegWit);

        static XPriv customMasterNode(const std::vector<uint8_t>& hmacKey, const std::vector<uint8_t>& seed,
                                      BackendHandle backend, Hint hint = Hint::SegWit);

        /**
         * @brief Derives the master node with the standard "Bitcoin seed" key.
         * Use a seed of AT LEAST 128 bits.
         */
        static XPriv rootFromSeed(const uint8_t* seed, size_t seedLen,
                                  BackendHandle backend, Hint hint = Hint::SegWit);

        static XPriv rootFromSeed(const std::vector<uint8_t>& seed,
                                  BackendHandle backend, Hint hint = Hint::SegWit);

        const XKeyInfo& info() const { return info_; }
        uint8_t depth() const { return info_.depth; }
        const KeyFingerprint& parent() const { return info_.parent; }
        uint32_t index() const { return info_.index; }
        const ChainCode& chainCode() const { return info_.chainCode; }
        Hint hint() const { return info_.hint; }

        const PrivateKey& privateKey() const { return key_; }
        const BackendHandle& backend() const { return key_.backend(); }

        /// The extended public key with the same metadata.
        XPub derivePublicKey() const;

        Point publicPoint() const { return key_.publicPoint(); }
        KeyFingerprint fingerprint() const { return key_.fingerprint(); }
        Bytes32 serialize() const { return key_.serialize(); }

        /**
         * @brief Applies the BIP-32 private child key derivation function.
         *
         * Hardened indices (>= 0x80000000) hash 0x00 || k || index, normal
         * ones hash K || index, both keyed by the chain code. The child
         * scalar is (I_L + k) mod n and the child chain code is I_R.
         *
         * @throw InvalidKey If I_L is not below n or the child scalar is zero.
         * @throw DepthOverflow If this key is already at depth 255.
         */
        XPriv derivePrivateChild(uint32_t index) const;

        /// Derives along @p path from left to right; the empty path returns a copy of this key.
        XPriv derivePrivatePath(const DerivationPath& path) const;

        bool operator==(const XPriv& other) const { return info_ == other.info_ && key_ == other.key_; }
        bool operator!=(const XPriv& other) const { return !(*this == other); }

    private:
        XKeyInfo info_;
        PrivateKey key_;
    };

    /**
     * @class XPub
     * @brief Extended public key. Only non-hardened children can be derived.
     */
    class XPub {
    public:
        using SigningKey = XPriv;

        XPub(const XKeyInfo& info, PublicKey key);

        static XPub fromXPriv(const XPriv& xpriv) { return xpriv.derivePublicKey(); }

        const XKeyInfo& info() const { return info_; }
        uint8_t depth() const { return info_.depth; }
        const KeyFingerprint& parent() const { return info_.parent; }
        uint32_t index() const { return info_.index; }
        const ChainCode& chainCode() const { return info_.chainCode; }
        Hint hint() const { return info_.hint; }

        const PublicKey& publicKey() const { return key_; }
        const Point& point() const { return key_.point(); }
        const BackendHandle& backend() const { return key_.backend(); }

        Point publicPoint() const { return key_.point(); }
        KeyFingerprint fingerprint() const { return key_.fingerprint(); }
        PointBytes serialize() const { return key_.serialize(); }

        /**
         * @brief Applies the BIP-32 public child key derivation function.
         *
         * The child point is I_L·G + K where I = HMAC-SHA512(c, K || index).
         *
         * @throw HardenedDerivationUnsupported If @p index is hardened.
         * @throw InvalidKey If I_L is not below n or the child is the point at infinity.
         * @throw DepthOverflow If this key is already at depth 255.
         */
        XPub derivePublicChild(uint32_t index) const;

        /// @throw HardenedDerivationUnsupported At the first hardened index of @p path.
        XPub derivePublicPath(const DerivationPath& path) const;

        bool operator==(const XPub& other) const { return info_ == other.info_ && key_ == other.key_; }
        bool operator!=(const XPub& other) const { return !(*this == other); }

    private:
        XKeyInfo info_;
        PublicKey key_;
    };

} // namespace Keytree

#endif // XKEYS_HPP
