#ifndef CURVE_HPP
#define CURVE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "exceptions.hpp"
#include "secure_memory.hpp"

/**
 * @file curve.hpp
 * @brief Curve backend capability and the scalar/point value types it produces.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    using Bytes32 = std::array<uint8_t, 32>;

    /// Compressed SEC1 encoding of a point (0x02/0x03 prefix followed by X).
    using PointBytes = std::array<uint8_t, 33>;

    class CurveBackend;

    /**
     * @class Scalar
     * @brief A private scalar in [1, n-1], serialized as 32 big-endian bytes.
     *
     * Only a CurveBackend can create one, so holding a Scalar means the value
     * was range-checked. The bytes are wiped when the object dies.
     */
    class Scalar {
    public:
        Scalar(const Scalar&) = default;
        Scalar& operator=(const Scalar&) = default;
        ~Scalar() { secure_memzero(bytes_.data(), bytes_.size()); }

        const Bytes32& bytes() const { return bytes_; }

        bool operator==(const Scalar& other) const { return bytes_ == other.bytes_; }
        bool operator!=(const Scalar& other) const { return !(*this == other); }

    private:
        friend class CurveBackend;
        explicit Scalar(const Bytes32& bytes) : bytes_(bytes) {}

        Bytes32 bytes_;
    };

    /**
     * @class Point
     * @brief A curve point other than the identity, held in compressed form.
     */
    class Point {
    public:
        const PointBytes& bytes() const { return bytes_; }

        bool operator==(const Point& other) const { return bytes_ == other.bytes_; }
        bool operator!=(const Point& other) const { return !(*this == other); }

    private:
        friend class CurveBackend;
        explicit Point(const PointBytes& bytes) : bytes_(bytes) {}

        PointBytes bytes_;
    };

    /**
     * @class CurveBackend
     * @brief Arithmetic over the secp256k1 group needed by BIP-32.
     *
     * Implementations must be immutable after construction: every method is
     * const and may be called concurrently. Keys share a backend through a
     * BackendHandle and never take exclusive ownership of it.
     *
     * Every method reports an invalid scalar or point by throwing InvalidKey.
     */
    class CurveBackend {
    public:
        /// secp256k1 group order n, big-endian.
        static constexpr Bytes32 ORDER = {
            0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
            0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
            0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
            0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
        };

        virtual ~CurveBackend() = default;

        /// Short identifier used in logs and configuration ("secp256k1", "openssl").
        virtual std::string name() const = 0;

        /// @throw InvalidKey If @p bytes is zero or not below the group order.
        virtual Scalar scalarFromBytes(const Bytes32& bytes) const = 0;

        /// @throw InvalidKey If @p bytes is not a valid compressed encoding.
        virtual Point pointFromBytes(const PointBytes& bytes) const = 0;

        /// Computes scalar·G.
        virtual Point scalarToPublicPoint(const Scalar& scalar) const = 0;

        /**
         * @brief Computes (key + tweak) mod n.
         * @throw InvalidKey If the tweak is not below n or the sum is zero.
         */
        virtual Scalar tweakAddScalar(const Scalar& key, const Bytes32& tweak) const = 0;

        /**
         * @brief Computes tweak·G + point.
         * @throw InvalidKey If the tweak is not below n or the sum is the identity.
         */
        virtual Point tweakAddPoint(const Point& point, const Bytes32& tweak) const = 0;

        /// Big-endian comparison against the group order.
        static bool isBelowOrder(const Bytes32& bytes) {
            for (std::size_t i = 0; i < bytes.size(); ++i) {
                if (bytes[i] < ORDER[i]) return true;
                if (bytes[i] > ORDER[i]) return false;
            }
            return false;
        }

        static bool isZero(const Bytes32& bytes) {
            uint8_t acc = 0;
            for (auto b : bytes) acc |= b;
            return acc == 0;
        }

    protected:
        CurveBackend() = default;
        CurveBackend(const CurveBackend&) = delete;
        CurveBackend& operator=(const CurveBackend&) = delete;

        static Scalar makeScalar(const Bytes32& bytes) { return Scalar(bytes); }
        static Point makePoint(const PointBytes& bytes) { return Point(bytes); }
    };

    /// Shared read-only handle to a backend; it lives as long as the last key using it.
    using BackendHandle = std::shared_ptr<const CurveBackend>;

} // namespace Keytree

#endif // CURVE_HPP
