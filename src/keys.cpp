#include "../include/keys.hpp"

#include <utility>

namespace Keytree {

    namespace {

        const CurveBackend& checkedBackend(const BackendHandle& backend) {
            if (!backend) {
                throw NoBackend("Key has no curve backend attached");
            }
            return *backend;
        }
    }

    PrivateKey::PrivateKey(Scalar key, BackendHandle backend)
        : key_(std::move(key)), backend_(std::move(backend)) {}

    PrivateKey PrivateKey::fromBytes(const Bytes32& bytes, BackendHandle backend) {
        Scalar scalar = checkedBackend(backend).scalarFromBytes(bytes);
        return PrivateKey(scalar, std::move(backend));
    }

    const CurveBackend& PrivateKey::requireBackend() const {
        return checkedBackend(backend_);
    }

    PublicKey PrivateKey::derivePublicKey() const {
        return PublicKey(publicPoint(), backend_);
    }

    Point PrivateKey::publicPoint() const {
        return requireBackend().scalarToPublicPoint(key_);
    }

    KeyFingerprint PrivateKey::fingerprint() const {
        return Hash::fingerprint(publicPoint());
    }

    PublicKey::PublicKey(Point key, BackendHandle backend)
        : key_(std::move(key)), backend_(std::move(backend)) {}

    PublicKey PublicKey::fromBytes(const PointBytes& bytes, BackendHandle backend) {
        Point point = checkedBackend(backend).pointFromBytes(bytes);
        return PublicKey(point, std::move(backend));
    }

    const CurveBackend& PublicKey::requireBackend() const {
        return checkedBackend(backend_);
    }

} // namespace Keytree
