#ifndef B32_HPP
#define B32_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "exceptions.hpp"
#include "secure_memory.hpp"

/**
 * @file b32.hpp
 * @brief Custom base32 alphabet and the short checksums used with it.
 */

namespace Sigil {

    /**
     * @class B32
     * @brief Base32 over the alphabet "abcdefghijkmnpqrstuvwxyz23456789".
     *
     * The alphabet leaves out 'l', 'o', '0' and '1'. Encoding emits lower-case
     * characters and no padding; decoding is case-insensitive.
     */
    class B32 {
    public:
        static const std::string ALPHABET;

        /**
         * @brief Position of c in the alphabet, or -1 if it is not part of it.
         */
        static int index(char c);

        static std::string encode(const uint8_t* data, size_t len);
        static std::string encode(const Bytes& data) { return encode(data.data(), data.size()); }

        /**
         * @brief Decode text produced by encode().
         *
         * Trailing '=' padding is tolerated.
         * @throw ParseFailure If the text contains foreign characters or has an impossible length.
         */
        static Bytes decode(const std::string& text);

        /**
         * @brief CRC-16/AUG-CCITT (poly 0x1021, init 0x1D0F) as two big-endian bytes.
         */
        static std::array<uint8_t, 2> checksum16(const uint8_t* data, size_t len);
        static std::array<uint8_t, 2> checksum16(const Bytes& data) { return checksum16(data.data(), data.size()); }

        /**
         * @brief True when ck holds the checksum16 of data.
         */
        static bool check16(const uint8_t* data, size_t len, const uint8_t ck[2]);

        /**
         * @brief First 3 bytes of SHA-256(data).
         */
        static std::array<uint8_t, 3> checksum24(const uint8_t* data, size_t len);
    };

} // namespace Sigil

#endif // B32_HPP
