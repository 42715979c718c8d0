#ifndef DERIVED_HPP
#define DERIVED_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "keys.hpp"
#include "path.hpp"
#include "xkeys.hpp"

/**
 * @file derived.hpp
 * @brief Keys coupled with the derivation path purportedly used to reach them.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    template <typename K>
    class Derived;

    namespace detail {

        // Derived<K>::VerifyingKey exists only when K::VerifyingKey does.
        template <typename K, typename = void>
        struct DerivedVerifyingKey {};

        template <typename K>
        struct DerivedVerifyingKey<K, std::void_t<typename K::VerifyingKey>> {
            using VerifyingKey = Derived<typename K::VerifyingKey>;
        };

        template <typename K, typename = void>
        struct DerivedSigningKey {};

        template <typename K>
        struct DerivedSigningKey<K, std::void_t<typename K::SigningKey>> {
            using SigningKey = Derived<typename K::SigningKey>;
        };
    }

    /**
     * @class Derived
     * @brief A key of kind K together with its claimed derivation path.
     *
     * K is one of PrivateKey, PublicKey, XPriv or XPub. Every kind provides
     * publicPoint(), fingerprint() and serialize(); the derivation members
     * below only compile for the kinds that support them (derivePrivateChild
     * for XPriv, derivePublicChild for XPub, and so on).
     *
     * Derived<PrivateKey>::VerifyingKey is Derived<PublicKey> and
     * Derived<PublicKey>::SigningKey is Derived<PrivateKey>; likewise for
     * XPriv and XPub.
     *
     * The path is metadata supplied by whoever built the value. Only
     * isPrivateAncestorOf() and isPublicAncestorOf() check it against key
     * material.
     */
    template <typename K>
    class Derived : public detail::DerivedVerifyingKey<K>, public detail::DerivedSigningKey<K> {
    public:
        using Key = K;

        Derived(K key, DerivationPath derivation)
            : key_(std::move(key)), derivation_(std::move(derivation)) {}

        /// Master node wrapped with the empty path. See XPriv::customMasterNode.
        static Derived customMasterNode(const std::vector<uint8_t>& hmacKey, const std::vector<uint8_t>& seed,
                                        BackendHandle backend, Hint hint = Hint::SegWit) {
            return Derived(K::customMasterNode(hmacKey, seed, std::move(backend), hint), DerivationPath());
        }

        /// Master node from the standard "Bitcoin seed" key, wrapped with the empty path.
        static Derived rootFromSeed(const std::vector<uint8_t>& seed, BackendHandle backend,
                                    Hint hint = Hint::SegWit) {
            return Derived(K::rootFromSeed(seed, std::move(backend), hint), DerivationPath());
        }

        const K& key() const { return key_; }
        const DerivationPath& derivation() const { return derivation_; }

        Point publicPoint() const { return key_.publicPoint(); }
        KeyFingerprint fingerprint() const { return key_.fingerprint(); }
        auto serialize() const { return key_.serialize(); }

        /// The public counterpart, carrying the same path.
        template <typename T = K>
        Derived<typename T::VerifyingKey> deriveVerifyingKey() const {
            return Derived<typename T::VerifyingKey>(key_.derivePublicKey(), derivation_);
        }

        /// Drops the HD metadata, keeping the plain private key and the path.
        template <typename T = K>
        Derived<PrivateKey> toDerivedPrivkey() const {
            return Derived<PrivateKey>(key_.privateKey(), derivation_);
        }

        /// Drops the HD metadata, keeping the plain public key and the path.
        template <typename T = K>
        Derived<PublicKey> toDerivedPubkey() const {
            return Derived<PublicKey>(key_.publicKey(), derivation_);
        }

        Derived derivePrivateChild(uint32_t index) const {
            return Derived(key_.derivePrivateChild(index), derivation_.extended(index));
        }

        Derived derivePublicChild(uint32_t index) const {
            return Derived(key_.derivePublicChild(index), derivation_.extended(index));
        }

        Derived derivePrivatePath(const DerivationPath& path) const {
            return Derived(key_.derivePrivatePath(path), derivation_.appended(path));
        }

        Derived derivePublicPath(const DerivationPath& path) const {
            return Derived(key_.derivePublicPath(path), derivation_.appended(path));
        }

        /**
         * @brief Indices leading from this key's path to @p other's path.
         * @return std::nullopt when this path is not a prefix of the other one.
         */
        template <typename O>
        std::optional<DerivationPath> pathToDescendant(const Derived<O>& other) const {
            return derivation_.pathToDescendant(other.derivation());
        }

        /**
         * @brief Checks that @p other really is the descendant its path claims.
         *
         * Returns false when the paths are unrelated or when the key derived
         * along the relative path has a different public key.
         *
         * @throw CryptoException If the derivation itself fails.
         */
        template <typename O>
        bool isPrivateAncestorOf(const Derived<O>& other) const {
            std::optional<DerivationPath> path = pathToDescendant(other);
            if (!path) {
                return false;
            }
            return key_.derivePrivatePath(*path).publicPoint() == other.publicPoint();
        }

        /**
         * @brief Public-key variant of isPrivateAncestorOf().
         *
         * @throw HardenedDerivationUnsupported If the relative path has a
         * hardened step; this is an error, not a negative answer.
         */
        template <typename O>
        bool isPublicAncestorOf(const Derived<O>& other) const {
            std::optional<DerivationPath> path = pathToDescendant(other);
            if (!path) {
                return false;
            }
            return key_.derivePublicPath(*path).publicPoint() == other.publicPoint();
        }

        bool operator==(const Derived& other) const {
            return key_ == other.key_ && derivation_ == other.derivation_;
        }
        bool operator!=(const Derived& other) const { return !(*this == other); }

    private:
        K key_;
        DerivationPath derivation_;
    };

    /// A PrivateKey coupled with its (purported) derivation path
    using DerivedPrivkey = Derived<PrivateKey>;

    /// A PublicKey coupled with its (purported) derivation path
    using DerivedPubkey = Derived<PublicKey>;

    /// An XPriv coupled with its (purported) derivation path
    using DerivedXPriv = Derived<XPriv>;

    /// An XPub coupled with its (purported) derivation path
    using DerivedXPub = Derived<XPub>;

} // namespace Keytree

#endif // DERIVED_HPP
