#ifndef OPENSSL_BACKEND_HPP
#define OPENSSL_BACKEND_HPP

#include <memory>
#include <string>

#include <openssl/bn.h>
#include <openssl/ec.h>

#include "curve.hpp"

/**
 * @file openssl_backend.hpp
 * @brief CurveBackend implemented on OpenSSL's EC_POINT / BIGNUM arithmetic.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @class OpensslBackend
     * @brief Alternative backend for hosts that already link libcrypto.
     *
     * The EC_GROUP is built once and only read afterwards; scratch BIGNUMs
     * and the BN_CTX are allocated per call.
     */
    class OpensslBackend : public CurveBackend {
    public:
        /// @throw CryptoException If OpenSSL does not know secp256k1.
        OpensslBackend();

        static BackendHandle create();

        std::string name() const override { return "openssl"; }

        Scalar scalarFromBytes(const Bytes32& bytes) const override;
        Point pointFromBytes(const PointBytes& bytes) const override;
        Point scalarToPublicPoint(const Scalar& scalar) const override;
        Scalar tweakAddScalar(const Scalar& key, const Bytes32& tweak) const override;
        Point tweakAddPoint(const Point& point, const Bytes32& tweak) const override;

    private:
        std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)> group_;
    };

} // namespace Keytree

#endif // OPENSSL_BACKEND_HPP
