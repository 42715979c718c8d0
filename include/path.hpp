#ifndef PATH_HPP
#define PATH_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @file path.hpp
 * @brief BIP-32 derivation paths.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    /// @brief BIP-32 Hardened derivation offset (2^31)
    static constexpr uint32_t HARDENED_OFFSET = 0x80000000;

    /**
     * @brief Utility to check if an index is in the hardened range.
     */
    constexpr bool isHardened(uint32_t index) {
        return (index & HARDENED_OFFSET) != 0;
    }

    /**
     * @brief Utility to apply the hardened offset to a standard index.
     */
    constexpr uint32_t hardenIndex(uint32_t index) {
        return index | HARDENED_OFFSET;
    }

    /**
     * @class DerivationPath
     * @brief Ordered list of child indices leading from some root to a key.
     *
     * A path attached to a key is only a claim about how the key was
     * obtained. Nothing in this class checks it against key material.
     */
    class DerivationPath {
    public:
        using const_iterator = std::vector<uint32_t>::const_iterator;

        DerivationPath() = default;
        DerivationPath(std::initializer_list<uint32_t> indices) : indices_(indices) {}
        explicit DerivationPath(std::vector<uint32_t> indices) : indices_(std::move(indices)) {}

        /**
         * @brief Parses a textual path such as "m/44'/0'/0'/0/5".
         *
         * The leading "m" (or "M") is optional; "m" alone and the empty
         * string denote the root. Hardened components may be marked with
         * ', h or H.
         *
         * @throw std::invalid_argument If a component is empty, not a decimal
         * number, or not below 2^31.
         */
        static DerivationPath parse(const std::string& path);

        /// Formats as "m/0'/1", using ' for hardened components.
        std::string toString() const;

        /// Copy of this path with @p index appended.
        DerivationPath extended(uint32_t index) const;

        /// Copy of this path followed by every index of @p suffix.
        DerivationPath appended(const DerivationPath& suffix) const;

        /// True if this path equals the first size() indices of @p other.
        bool isPrefixOf(const DerivationPath& other) const;

        /**
         * @brief Indices that lead from this path to @p other.
         * @return The suffix of @p other after this path, or std::nullopt if
         * this path is not a prefix of it.
         */
        std::optional<DerivationPath> pathToDescendant(const DerivationPath& other) const;

        bool hasHardenedStep() const;

        const std::vector<uint32_t>& indices() const { return indices_; }
        size_t size() const { return indices_.size(); }
        bool empty() const { return indices_.empty(); }
        uint32_t operator[](size_t i) const { return indices_[i]; }
        const_iterator begin() const { return indices_.begin(); }
        const_iterator end() const { return indices_.end(); }

        bool operator==(const DerivationPath& other) const { return indices_ == other.indices_; }
        bool operator!=(const DerivationPath& other) const { return indices_ != other.indices_; }

    private:
        std::vector<uint32_t> indices_;
    };

} // namespace Keytree

#endif // PATH_HPP
