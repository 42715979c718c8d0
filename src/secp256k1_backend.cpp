#include "../include/secp256k1_backend.hpp"
#include "../include/logger.hpp"

#include <algorithm>

/**
 * @file secp256k1_backend.cpp
 * @brief libsecp256k1 implementation of the curve backend.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    Secp256k1Backend::Secp256k1Backend()
        : ctx_(secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY),
               &secp256k1_context_destroy) {
        if (!ctx_) {
            throw CryptoException("libsecp256k1 context creation failed");
        }
        Logger::info("secp256k1 curve backend ready", __FILE__, __LINE__);
    }

    BackendHandle Secp256k1Backend::create() {
        return std::make_shared<Secp256k1Backend>();
    }

    Scalar Secp256k1Backend::scalarFromBytes(const Bytes32& bytes) const {
        if (!secp256k1_ec_seckey_verify(ctx_.get(), bytes.data())) {
            throw InvalidKey("Scalar is zero or not below the group order");
        }
        return makeScalar(bytes);
    }

    Point Secp256k1Backend::pointFromBytes(const PointBytes& bytes) const {
        return serialize(parse(bytes));
    }

    Point Secp256k1Backend::scalarToPublicPoint(const Scalar& scalar) const {
        secp256k1_pubkey pubkey;
        if (!secp256k1_ec_pubkey_create(ctx_.get(), &pubkey, scalar.bytes().data())) {
            throw InvalidKey("Failure to create the public key");
        }
        return serialize(pubkey);
    }

    Scalar Secp256k1Backend::tweakAddScalar(const Scalar& key, const Bytes32& tweak) const {
        if (!isBelowOrder(tweak)) {
            throw InvalidKey("Tweak is not below the group order");
        }

        // secp256k1_ec_seckey_tweak_add works in place
        Bytes32 sum = key.bytes();
        if (!secp256k1_ec_seckey_tweak_add(ctx_.get(), sum.data(), tweak.data())) {
            secure_memzero(sum.data(), sum.size());
            throw InvalidKey("Tweaked scalar is zero");
        }

        Scalar result = makeScalar(sum);
        secure_memzero(sum.data(), sum.size());
        return result;
    }

    Point Secp256k1Backend::tweakAddPoint(const Point& point, const Bytes32& tweak) const {
        if (!isBelowOrder(tweak)) {
            throw InvalidKey("Tweak is not below the group order");
        }

        secp256k1_pubkey pubkey = parse(point.bytes());
        if (!secp256k1_ec_pubkey_tweak_add(ctx_.get(), &pubkey, tweak.data())) {
            throw InvalidKey("Tweaked point is the point at infinity");
        }
        return serialize(pubkey);
    }

    secp256k1_pubkey Secp256k1Backend::parse(const PointBytes& bytes) const {
        if (bytes[0] != 0x02 && bytes[0] != 0x03) {
            throw InvalidKey("Point is not in compressed form");
        }

        secp256k1_pubkey pubkey;
        if (!secp256k1_ec_pubkey_parse(ctx_.get(), &pubkey, bytes.data(), bytes.size())) {
            throw InvalidKey("Point is not on the curve");
        }
        return pubkey;
    }

    Point Secp256k1Backend::serialize(const secp256k1_pubkey& pubkey) const {
        PointBytes out;
        size_t outLen = out.size();
        if (!secp256k1_ec_pubkey_serialize(ctx_.get(), out.data(), &outLen, &pubkey, SECP256K1_EC_COMPRESSED)
            || outLen != out.size()) {
            throw CryptoException("Public key serialization failed");
        }
        return makePoint(out);
    }

} // namespace Keytree
