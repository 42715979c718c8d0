#include "../include/xkeys.hpp"
#include "../include/logger.hpp"
#include "../include/secure_memory.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>
#include <utility>

/**
 * @file xkeys.cpp
 * @brief Implementation of extended keys compliant with BIP-32.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    namespace {

        template <typename E>
        [[noreturn]] void reject(const std::string& message) {
            Logger::warning(message, __FILE__, __LINE__);
            throw E(message);
        }

        // We add the index in BIG ENDIAN
        void appendIndex(SecureBytes& data, uint32_t index) {
            data.push_back(static_cast<uint8_t>((index >> 24) & 0xFF));
            data.push_back(static_cast<uint8_t>((index >> 16) & 0xFF));
            data.push_back(static_cast<uint8_t>((index >> 8) & 0xFF));
            data.push_back(static_cast<uint8_t>(index & 0xFF));
        }

        // Format: parent public key | index
        SecureBytes normalChildData(const Point& parentPoint, uint32_t index) {
            SecureBytes data;
            data.reserve(37);
            data.insert(data.end(), parentPoint.bytes().begin(), parentPoint.bytes().end());
            appendIndex(data, index);
            return data;
        }

        void checkDepth(const XKeyInfo& parent) {
            if (parent.depth == 0xFF) {
                reject<DepthOverflow>("Cannot derive below depth 255");
            }
        }

        XKeyInfo childInfo(const XKeyInfo& parent, const Point& parentPoint,
                           uint32_t index, const ChainCode& chainCode) {
            XKeyInfo child;
            child.depth = static_cast<uint8_t>(parent.depth + 1);
            child.parent = Hash::fingerprint(parentPoint);
            child.index = index;
            child.chainCode = chainCode;
            child.hint = parent.hint;
            return child;
        }

        std::string indexToString(uint32_t index) {
            std::string s = std::to_string(index & ~HARDENED_OFFSET);
            if (isHardened(index)) s += '\'';
            return s;
        }
    }

    std::string hintToString(Hint hint) {
        switch (hint) {
            case Hint::Legacy: return "legacy";
            case Hint::Compatibility: return "compatibility";
            case Hint::SegWit: return "segwit";
        }
        return "unknown";
    }

    Hint hintFromString(const std::string& name) {
        std::string s = name;
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });

        if (s == "legacy") return Hint::Legacy;
        if (s == "compatibility") return Hint::Compatibility;
        if (s == "segwit") return Hint::SegWit;

        throw std::invalid_argument("Unknown key hint: " + name);
    }

    // ---------------------------------------------------------------- XPriv

    XPriv::XPriv(const XKeyInfo& info, PrivateKey key)
        : info_(info), key_(std::move(key)) {}

    XPriv XPriv::customMasterNode(const uint8_t* hmacKey, size_t hmacKeyLen,
                                  const uint8_t* seed, size_t seedLen,
                                  BackendHandle backend, Hint hint) {
        if (seedLen < MIN_SEED_BYTES) {
            reject<SeedTooShort>("Seed must be at least 128 bits, got " + std::to_string(seedLen * 8));
        }
        if (!backend) {
            reject<NoBackend>("Master node generation requires a curve backend");
        }

        // Left 32 bytes: master private key / Right 32 bytes: master chain code
        std::pair<Bytes32, Bytes32> I = Hash::hmacAndSplit(hmacKey, hmacKeyLen, seed, seedLen);

        if (CurveBackend::isZero(I.first) || !CurveBackend::isBelowOrder(I.first)) {
            secure_memzero(I.first.data(), I.first.size());
            reject<InvalidKey>("Master key is zero or not below the group order");
        }

        Scalar scalar = backend->scalarFromBytes(I.first);
        secure_memzero(I.first.data(), I.first.size());

        XKeyInfo info;
        info.depth = 0;
        info.parent = KeyFingerprint{};
        info.index = 0;
        info.chainCode = I.second;
        info.hint = hint;

        Logger::debug("Master node created (hint=" + hintToString(hint) + ", backend=" + backend->name() + ")",
                      __FILE__, __LINE__);

        return XPriv(info, PrivateKey(scalar, std::move(backend)));
    }

    XPriv XPriv::customMasterNode(const std::vector<uint8_t>& hmacKey, const std::vector<uint8_t>& seed,
                                  BackendHandle backend, Hint hint) {
        return customMasterNode(hmacKey.data(), hmacKey.size(), seed.data(), seed.size(),
                                std::move(backend), hint);
    }

    XPriv XPriv::rootFromSeed(const uint8_t* seed, size_t seedLen, BackendHandle backend, Hint hint) {
        return customMasterNode(reinterpret_cast<const uint8_t*>(BIP32_HMAC_KEY), std::strlen(BIP32_HMAC_KEY),
                                seed, seedLen, std::move(backend), hint);
    }

    XPriv XPriv::rootFromSeed(const std::vector<uint8_t>& seed, BackendHandle backend, Hint hint) {
        return rootFromSeed(seed.data(), seed.size(), std::move(backend), hint);
    }

    XPub XPriv::derivePublicKey() const {
        return XPub(info_, key_.derivePublicKey());
    }

    XPriv XPriv::derivePrivateChild(uint32_t index) const {
        checkDepth(info_);

        const CurveBackend& backend = key_.requireBackend();
        Point parentPoint = backend.scalarToPublicPoint(key_.scalar());

        SecureBytes data;
        if (isHardened(index)) {
            // Hardened derivation
            // Format: 0x00 | parent private key | index
            data.reserve(37);
            data.push_back(0x00);
            data.insert(data.end(), key_.scalar().bytes().begin(), key_.scalar().bytes().end());
            appendIndex(data, index);
        } else {
            data = normalChildData(parentPoint, index);
        }

        std::pair<Bytes32, Bytes32> I = Hash::hmacAndSplit(info_.chainCode.data(), info_.chainCode.size(),
                                                           data.data(), data.size());

        XKeyInfo info = childInfo(info_, parentPoint, index, I.second);

        // Child Private Key = (IL + Parent Private Key) % n
        try {
            Scalar child = backend.tweakAddScalar(key_.scalar(), I.first);
            secure_memzero(I.first.data(), I.first.size());
            return XPriv(info, PrivateKey(child, key_.backend()));
        } catch (const CryptoException& e) {
            secure_memzero(I.first.data(), I.first.size());
            Logger::warning("Private child " + indexToString(index) + " is invalid: " + e.what(),
                            __FILE__, __LINE__);
            throw;
        }
    }

    XPriv XPriv::derivePrivatePath(const DerivationPath& path) const {
        XPriv current = *this;
        for (uint32_t index : path) {
            current = current.derivePrivateChild(index);
        }
        return current;
    }

    // ----------------------------------------------------------------- XPub

    XPub::XPub(const XKeyInfo& info, PublicKey key)
        : info_(info), key_(std::move(key)) {}

    XPub XPub::derivePublicChild(uint32_t index) const {
        if (isHardened(index)) {
            reject<HardenedDerivationUnsupported>(
                "Hardened child " + indexToString(index) + " cannot be derived from a public key");
        }

        checkDepth(info_);

        const CurveBackend& backend = key_.requireBackend();

        SecureBytes data = normalChildData(key_.point(), index);
        std::pair<Bytes32, Bytes32> I = Hash::hmacAndSplit(info_.chainCode.data(), info_.chainCode.size(),
                                                           data.data(), data.size());

        XKeyInfo info = childInfo(info_, key_.point(), index, I.second);

        // Child Public Key = IL * G + Parent Public Key
        try {
            Point child = backend.tweakAddPoint(key_.point(), I.first);
            return XPub(info, PublicKey(child, key_.backend()));
        } catch (const CryptoException& e) {
            Logger::warning("Public child " + indexToString(index) + " is invalid: " + e.what(),
                            __FILE__, __LINE__);
            throw;
        }
    }

    XPub XPub::derivePublicPath(const DerivationPath& path) const {
        XPub current = *this;
        for (uint32_t index : path) {
            current = current.derivePublicChild(index);
        }
        return current;
    }

} // namespace Keytree
