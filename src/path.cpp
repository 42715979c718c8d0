#include "../include/path.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

/**
 * @file path.cpp
 * @brief Implementation of DerivationPath.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    namespace {

        uint32_t parseComponent(std::string token, const std::string& path) {
            bool hardened = false;

            // Check for hardened marker (' or h)
            if (!token.empty() && (token.back() == '\'' || token.back() == 'h' || token.back() == 'H')) {
                hardened = true;
                token.pop_back();
            }

            if (token.empty() || token.size() > 10) {
                throw std::invalid_argument("Invalid path format: " + path);
            }

            uint64_t value = 0;
            for (char c : token) {
                if (c < '0' || c > '9') {
                    throw std::invalid_argument("Invalid path format: " + path);
                }
                value = value * 10 + static_cast<uint64_t>(c - '0');
            }

            if (value >= HARDENED_OFFSET) {
                throw std::invalid_argument("Path index out of range: " + path);
            }

            uint32_t index = static_cast<uint32_t>(value);
            return hardened ? hardenIndex(index) : index;
        }
    }

    DerivationPath DerivationPath::parse(const std::string& path) {
        std::vector<uint32_t> indices;

        std::string body = path;
        if (body == "m" || body == "M" || body.empty()) {
            return DerivationPath();
        }
        if (body.size() >= 2 && (body[0] == 'm' || body[0] == 'M') && body[1] == '/') {
            body = body.substr(2);
            if (body.empty()) {
                throw std::invalid_argument("Invalid path format: " + path);
            }
        }

        std::stringstream ss(body);
        std::string token;

        // Parse the path string separated by '/'
        while (std::getline(ss, token, '/')) {
            indices.push_back(parseComponent(token, path));
        }

        // getline does not report a trailing empty component
        if (!body.empty() && body.back() == '/') {
            throw std::invalid_argument("Invalid path format: " + path);
        }

        return DerivationPath(std::move(indices));
    }

    std::string DerivationPath::toString() const {
        std::string ret = "m";
        for (uint32_t i : indices_) {
            ret += '/';
            ret += std::to_string(i & ~HARDENED_OFFSET);
            if (isHardened(i)) ret += '\'';
        }
        return ret;
    }

    DerivationPath DerivationPath::extended(uint32_t index) const {
        DerivationPath out(*this);
        out.indices_.push_back(index);
        return out;
    }

    DerivationPath DerivationPath::appended(const DerivationPath& suffix) const {
        DerivationPath out(*this);
        out.indices_.insert(out.indices_.end(), suffix.indices_.begin(), suffix.indices_.end());
        return out;
    }

    bool DerivationPath::isPrefixOf(const DerivationPath& other) const {
        if (indices_.size() > other.indices_.size()) return false;
        return std::equal(indices_.begin(), indices_.end(), other.indices_.begin());
    }

    std::optional<DerivationPath> DerivationPath::pathToDescendant(const DerivationPath& other) const {
        if (!isPrefixOf(other)) {
            return std::nullopt;
        }
        return DerivationPath(std::vector<uint32_t>(other.indices_.begin() + indices_.size(),
                                                    other.indices_.end()));
    }

    bool DerivationPath::hasHardenedStep() const {
        return std::any_of(indices_.begin(), indices_.end(), [](uint32_t i) { return isHardened(i); });
    }

} // namespace Keytree
