#ifndef SECP256K1_BACKEND_HPP
#define SECP256K1_BACKEND_HPP

#include <memory>
#include <string>

#include <secp256k1.h>

#include "curve.hpp"

/**
 * @file secp256k1_backend.hpp
 * @brief CurveBackend implemented on libsecp256k1.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @class Secp256k1Backend
     * @brief Default backend. Owns one libsecp256k1 context for its whole
     * lifetime; the context is only used through const entry points, which
     * libsecp256k1 documents as safe for concurrent use.
     */
    class Secp256k1Backend : public CurveBackend {
    public:
        /// @throw CryptoException If the context cannot be created.
        Secp256k1Backend();

        static BackendHandle create();

        std::string name() const override { return "secp256k1"; }

        Scalar scalarFromBytes(const Bytes32& bytes) const override;
        Point pointFromBytes(const PointBytes& bytes) const override;
        Point scalarToPublicPoint(const Scalar& scalar) const override;
        Scalar tweakAddScalar(const Scalar& key, const Bytes32& tweak) const override;
        Point tweakAddPoint(const Point& point, const Bytes32& tweak) const override;

    private:
        std::unique_ptr<secp256k1_context, decltype(&secp256k1_context_destroy)> ctx_;

        secp256k1_pubkey parse(const PointBytes& bytes) const;
        Point serialize(const secp256k1_pubkey& pubkey) const;
    };

} // namespace Keytree

#endif // SECP256K1_BACKEND_HPP
