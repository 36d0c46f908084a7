#ifndef SEED_HPP
#define SEED_HPP

#include <cstddef>
#include <cstdint>

#include "exceptions.hpp"
#include "random.hpp"
#include "secure_memory.hpp"

/**
 * @file seed.hpp
 * @brief Generation of seeds for HD master keys.
 */

namespace Sigil {

    /**
     * @class Seed
     * @brief Generates and validates the seeds accepted by ExtendedKey::newMaster.
     */
    class Seed {
        public:
            /// @brief 128 bits
            static constexpr size_t MIN_BYTES = 16;
            /// @brief 512 bits
            static constexpr size_t MAX_BYTES = 64;
            /// @brief 256 bits
            static constexpr size_t RECOMMENDED_BYTES = 32;

            /**
             * @brief Check that a seed length is within [MIN_BYTES, MAX_BYTES].
             * @param length Seed size in bytes.
             * @throw InvalidLength If the length is out of range.
             */
            static void checkLength(size_t length);

            /**
             * @brief Draw a seed from a randomness source.
             * @param length Seed size in bytes (16 to 64).
             * @param rng Source of randomness.
             * @return The seed, held in a buffer that is wiped on release.
             * @throw InvalidLength If length is out of range.
             * @throw CryptoException If the source fails.
             */
            static SecureBytes generate(size_t length, RandomSource& rng);

            /**
             * @brief Draw a seed from the system CSPRNG.
             */
            static SecureBytes generate(size_t length = RECOMMENDED_BYTES);
    };
}


#endif
