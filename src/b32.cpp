#include "../include/b32.hpp"
#include "../include/hash.hpp"

#include <cctype>

/**
 * @file b32.cpp
 * @brief Implementation of the custom base32 codec and short checksums.
 */

namespace Sigil {

    const std::string B32::ALPHABET = "abcdefghijkmnpqrstuvwxyz23456789";

    int B32::index(char c) {
        size_t pos = ALPHABET.find(c);
        return (pos == std::string::npos) ? -1 : static_cast<int>(pos);
    }

    std::string B32::encode(const uint8_t* data, size_t len) {
        std::string out;
        out.reserve((len * 8 + 4) / 5);

        uint32_t accumulator = 0;
        int bits = 0;

        for (size_t i = 0; i < len; ++i) {
            accumulator = (accumulator << 8) | data[i];
            bits += 8;

            while (bits >= 5) {
                bits -= 5;
                out.push_back(ALPHABET[(accumulator >> bits) & 0x1F]);
            }
        }

        // Flush the remaining bits, left-aligned in a final symbol
        if (bits > 0) {
            out.push_back(ALPHABET[(accumulator << (5 - bits)) & 0x1F]);
        }

        return out;
    }

    Bytes B32::decode(const std::string& text) {
        size_t len = text.size();
        while (len > 0 && text[len - 1] == '=') --len;

        // A group of 8 symbols carries 5 bytes; 1, 3 and 6 leftover symbols cannot occur.
        size_t tail = len % 8;
        if (tail == 1 || tail == 3 || tail == 6)
            throw ParseFailure("Invalid base32 length: " + std::to_string(text.size()));

        Bytes out;
        out.reserve(len * 5 / 8);

        uint32_t accumulator = 0;
        int bits = 0;

        for (size_t i = 0; i < len; ++i) {
            char c = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
            int value = index(c);
            if (value < 0)
                throw ParseFailure("Invalid base32 character at offset " + std::to_string(i));

            accumulator = (accumulator << 5) | static_cast<uint32_t>(value);
            bits += 5;

            if (bits >= 8) {
                bits -= 8;
                out.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFF));
            }
        }

        return out;
    }

    std::array<uint8_t, 2> B32::checksum16(const uint8_t* data, size_t len) {
        uint16_t crc = 0x1D0F;

        for (size_t i = 0; i < len; ++i) {
            crc ^= static_cast<uint16_t>(data[i]) << 8;
            for (int bit = 0; bit < 8; ++bit) {
                if (crc & 0x8000)
                    crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
                else
                    crc = static_cast<uint16_t>(crc << 1);
            }
        }

        return {{static_cast<uint8_t>((crc >> 8) & 0xFF), static_cast<uint8_t>(crc & 0xFF)}};
    }

    bool B32::check16(const uint8_t* data, size_t len, const uint8_t ck[2]) {
        std::array<uint8_t, 2> expected = checksum16(data, len);
        return expected[0] == ck[0] && expected[1] == ck[1];
    }

    std::array<uint8_t, 3> B32::checksum24(const uint8_t* data, size_t len) {
        Hash::Digest256 h = Hash::sha256(data, len);
        return {{h[0], h[1], h[2]}};
    }

} // namespace Sigil
