#ifndef CHECKSUM_HPP
#define CHECKSUM_HPP

#include <cstddef>
#include <cstdint>

#include "secure_memory.hpp"

/**
 * @file checksum.hpp
 * @brief Variable-width truncated SHA-224 checksum for keys and signatures.
 */

namespace Sigil {

    /**
     * @class Checksum
     * @brief Frames a payload as [width] ++ payload ++ tail(SHA-224(payload), width).
     *
     * The width is chosen so that the framed length is a multiple of PAD_WIDTH,
     * which lets the base32 encoding run without padding characters.
     */
    class Checksum {
    public:
        /// @brief Framed length is always a multiple of this value.
        static constexpr size_t PAD_WIDTH = 5;
        /// @brief Minimum number of checksum bytes (false positive rate ~ 1 / 2^24).
        static constexpr size_t MIN_BYTES = 3;

        /**
         * @brief Checksum width for a payload of inputLen bytes.
         */
        static uint8_t width(size_t inputLen);

        /**
         * @brief The last n bytes of SHA-224(data).
         */
        static Bytes compute(const uint8_t* data, size_t len, uint8_t n);

        /**
         * @brief Frame a payload with its width byte and checksum.
         */
        static Bytes add(const Bytes& payload);

        /**
         * @brief Verify a framed buffer and extract its payload.
         * @param framed Buffer produced by add().
         * @param payload Receives the payload on success.
         * @return true if the checksum matches.
         */
        static bool check(const Bytes& framed, Bytes& payload);
    };

} // namespace Sigil

#endif // CHECKSUM_HPP
