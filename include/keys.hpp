#ifndef KEYS_HPP
#define KEYS_HPP

#include "curve.hpp"
#include "hash.hpp"

/**
 * @file keys.hpp
 * @brief Plain private/public keys paired with an optional curve backend.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    class PublicKey;

    /**
     * @class PrivateKey
     * @brief A validated scalar plus the backend used for arithmetic on it.
     *
     * The backend may be null; such a key can still be compared and
     * serialized but every operation that needs the curve throws NoBackend.
     */
    class PrivateKey {
    public:
        using VerifyingKey = PublicKey;

        explicit PrivateKey(Scalar key, BackendHandle backend = nullptr);

        /**
         * @brief Validate @p bytes through @p backend and wrap the result.
         * @throw NoBackend If @p backend is null.
         * @throw InvalidKey If the bytes are not a valid scalar.
         */
        static PrivateKey fromBytes(const Bytes32& bytes, BackendHandle backend);

        const Scalar& scalar() const { return key_; }
        const BackendHandle& backend() const { return backend_; }

        /// @throw NoBackend If the key has no backend.
        const CurveBackend& requireBackend() const;

        /// The matching public key, sharing this key's backend.
        PublicKey derivePublicKey() const;

        Point publicPoint() const;
        KeyFingerprint fingerprint() const;
        Bytes32 serialize() const { return key_.bytes(); }

        /// Compares key material only; the backend is not part of a key's identity.
        bool operator==(const PrivateKey& other) const { return key_ == other.key_; }
        bool operator!=(const PrivateKey& other) const { return !(*this == other); }

    private:
        Scalar key_;
        BackendHandle backend_;
    };

    /**
     * @class PublicKey
     * @brief A validated curve point plus an optional backend.
     */
    class PublicKey {
    public:
        using SigningKey = PrivateKey;

        explicit PublicKey(Point key, BackendHandle backend = nullptr);

        /// @throw NoBackend, InvalidKey
        static PublicKey fromBytes(const PointBytes& bytes, BackendHandle backend);

        const Point& point() const { return key_; }
        const BackendHandle& backend() const { return backend_; }

        /// @throw NoBackend If the key has no backend.
        const CurveBackend& requireBackend() const;

        Point publicPoint() const { return key_; }
        KeyFingerprint fingerprint() const { return Hash::fingerprint(key_); }
        PointBytes serialize() const { return key_.bytes(); }

        bool operator==(const PublicKey& other) const { return key_ == other.key_; }
        bool operator!=(const PublicKey& other) const { return !(*this == other); }

    private:
        Point key_;
        BackendHandle backend_;
    };

} // namespace Keytree

#endif // KEYS_HPP
