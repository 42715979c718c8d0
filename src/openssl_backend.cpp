#include "../include/openssl_backend.hpp"
#include "../include/logger.hpp"

#include <openssl/obj_mac.h>

/**
 * @file openssl_backend.cpp
 * @brief OpenSSL implementation of the curve backend.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    namespace {

        using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
        using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
        using PointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

        BnPtr toBignum(const Bytes32& bytes) {
            BnPtr bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr), &BN_clear_free);
            if (!bn) {
                throw CryptoException("BN_bin2bn failed");
            }
            return bn;
        }

        BnCtxPtr newContext() {
            BnCtxPtr ctx(BN_CTX_new(), &BN_CTX_free);
            if (!ctx) {
                throw CryptoException("BN_CTX_new failed");
            }
            return ctx;
        }

        PointPtr newPoint(const EC_GROUP* group) {
            PointPtr point(EC_POINT_new(group), &EC_POINT_free);
            if (!point) {
                throw CryptoException("EC_POINT_new failed");
            }
            return point;
        }

        PointPtr parsePoint(const EC_GROUP* group, const PointBytes& bytes, BN_CTX* ctx) {
            if (bytes[0] != 0x02 && bytes[0] != 0x03) {
                throw InvalidKey("Point is not in compressed form");
            }

            PointPtr point = newPoint(group);
            if (!EC_POINT_oct2point(group, point.get(), bytes.data(), bytes.size(), ctx)) {
                throw InvalidKey("Point is not on the curve");
            }
            return point;
        }

        PointBytes serializePoint(const EC_GROUP* group, const EC_POINT* point, BN_CTX* ctx) {
            if (EC_POINT_is_at_infinity(group, point)) {
                throw InvalidKey("Point at infinity");
            }

            PointBytes out;
            size_t size = EC_POINT_point2oct(group, point, POINT_CONVERSION_COMPRESSED,
                                             out.data(), out.size(), ctx);
            if (size != out.size()) {
                throw CryptoException("EC_POINT_point2oct failed");
            }
            return out;
        }
    }

    OpensslBackend::OpensslBackend()
        : group_(EC_GROUP_new_by_curve_name(NID_secp256k1), &EC_GROUP_free) {
        if (!group_) {
            throw CryptoException("OpenSSL does not provide secp256k1");
        }
        Logger::info("openssl curve backend ready", __FILE__, __LINE__);
    }

    BackendHandle OpensslBackend::create() {
        return std::make_shared<OpensslBackend>();
    }

    Scalar OpensslBackend::scalarFromBytes(const Bytes32& bytes) const {
        if (isZero(bytes) || !isBelowOrder(bytes)) {
            throw InvalidKey("Scalar is zero or not below the group order");
        }
        return makeScalar(bytes);
    }

    Point OpensslBackend::pointFromBytes(const PointBytes& bytes) const {
        BnCtxPtr ctx = newContext();
        PointPtr point = parsePoint(group_.get(), bytes, ctx.get());
        return makePoint(serializePoint(group_.get(), point.get(), ctx.get()));
    }

    Point OpensslBackend::scalarToPublicPoint(const Scalar& scalar) const {
        BnCtxPtr ctx = newContext();
        BnPtr k = toBignum(scalar.bytes());
        PointPtr pub = newPoint(group_.get());

        // pub = k * G
        if (!EC_POINT_mul(group_.get(), pub.get(), k.get(), nullptr, nullptr, ctx.get())) {
            throw CryptoException("EC_POINT_mul failed");
        }
        return makePoint(serializePoint(group_.get(), pub.get(), ctx.get()));
    }

    Scalar OpensslBackend::tweakAddScalar(const Scalar& key, const Bytes32& tweak) const {
        if (!isBelowOrder(tweak)) {
            throw InvalidKey("Tweak is not below the group order");
        }

        BnCtxPtr ctx = newContext();
        BnPtr sum = toBignum(key.bytes());
        BnPtr t = toBignum(tweak);

        const BIGNUM* order = EC_GROUP_get0_order(group_.get());
        if (!order || !BN_mod_add(sum.get(), sum.get(), t.get(), order, ctx.get())) {
            throw CryptoException("BN_mod_add failed");
        }
        if (BN_is_zero(sum.get())) {
            throw InvalidKey("Tweaked scalar is zero");
        }

        Bytes32 out;
        if (BN_bn2binpad(sum.get(), out.data(), static_cast<int>(out.size())) != static_cast<int>(out.size())) {
            throw CryptoException("BN_bn2binpad failed");
        }

        Scalar result = makeScalar(out);
        secure_memzero(out.data(), out.size());
        return result;
    }

    Point OpensslBackend::tweakAddPoint(const Point& point, const Bytes32& tweak) const {
        if (!isBelowOrder(tweak)) {
            throw InvalidKey("Tweak is not below the group order");
        }

        BnCtxPtr ctx = newContext();
        PointPtr parent = parsePoint(group_.get(), point.bytes(), ctx.get());
        BnPtr t = toBignum(tweak);
        PointPtr child = newPoint(group_.get());

        // child = t * G + 1 * parent
        if (!EC_POINT_mul(group_.get(), child.get(), t.get(), parent.get(), BN_value_one(), ctx.get())) {
            throw CryptoException("EC_POINT_mul failed");
        }
        return makePoint(serializePoint(group_.get(), child.get(), ctx.get()));
    }

} // namespace Keytree
