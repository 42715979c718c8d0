#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

/**
 * @file exceptions.hpp
 * @brief Exception hierarchy for key derivation failures.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /**
     * @class CryptoException
     * @brief Base class for all cryptographic related exceptions.
     *
     * Catch this type if you want to handle every derivation error at once.
     * It is also thrown directly when OpenSSL or libsecp256k1 report an
     * internal failure (context creation, HMAC computation).
     */
    class CryptoException : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @class SeedTooShort
     * @brief Thrown when a master node is requested from less than 128 bits of seed.
     */
    class SeedTooShort : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /**
     * @class InvalidKey
     * @brief Thrown when a scalar is zero or not below the group order,
     * or when a point is malformed or the point at infinity.
     *
     * BIP-32 reports these cases instead of skipping to the next index.
     */
    class InvalidKey : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /**
     * @class HardenedDerivationUnsupported
     * @brief Thrown when a hardened child is requested from a public key.
     */
    class HardenedDerivationUnsupported : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /**
     * @class DepthOverflow
     * @brief Thrown when a derivation would exceed depth 255.
     */
    class DepthOverflow : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /**
     * @class NoBackend
     * @brief Thrown when curve arithmetic is requested from a key that
     * carries no backend handle.
     */
    class NoBackend : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

} // namespace Keytree

#endif // EXCEPTIONS_HPP
