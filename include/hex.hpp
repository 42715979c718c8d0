#ifndef HEX_HPP
#define HEX_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @file hex.hpp
 * @brief Hexadecimal conversion helpers used by the CLI and the tests.
 * @author Keytree Project
 * @date 2026
 */

namespace Keytree {

    class Hex {
    public:
        /**
         * @brief Convert a hexadecimal string to a byte container.
         * Pass SecureBytes as @p Bytes for secret input such as seeds.
         * @throw std::invalid_argument On odd length or a non-hex character.
         */
        template <typename Bytes = std::vector<uint8_t>>
        static Bytes decode(const std::string& hex) {
            if (hex.length() % 2 != 0) {
                throw std::invalid_argument("Invalid hex string length");
            }

            Bytes bytes;
            bytes.reserve(hex.length() / 2);

            for (size_t i = 0; i < hex.length(); i += 2) {
                int hi = nibble(hex[i]);
                int lo = nibble(hex[i + 1]);
                if (hi < 0 || lo < 0) {
                    throw std::invalid_argument("Invalid hex character at offset " + std::to_string(i));
                }
                bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
            }

            return bytes;
        }

        static std::string encode(const uint8_t* data, size_t len) {
            static const char hex_chars[] = "0123456789abcdef";

            std::string result;
            result.reserve(len * 2);
            for (size_t i = 0; i < len; ++i) {
                result.push_back(hex_chars[data[i] >> 4]);
                result.push_back(hex_chars[data[i] & 0x0F]);
            }
            return result;
        }

        static std::string encode(const std::vector<uint8_t>& data) {
            return encode(data.data(), data.size());
        }

        template <std::size_t N>
        static std::string encode(const std::array<uint8_t, N>& data) {
            return encode(data.data(), data.size());
        }

    private:
        static int nibble(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    };

} // namespace Keytree

#endif // HEX_HPP
