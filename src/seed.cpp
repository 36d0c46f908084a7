#include "../include/seed.hpp"

#include <string>

/**
 * @file seed.cpp
 * @brief Implementation of seed generation.
 */

namespace Sigil {

    void Seed::checkLength(size_t length) {
        if (length < MIN_BYTES || length > MAX_BYTES) {
            throw InvalidLength("Seed length must be between " + std::to_string(MIN_BYTES * 8) +
                                " and " + std::to_string(MAX_BYTES * 8) + " bits, got " +
                                std::to_string(length * 8));
        }
    }

    SecureBytes Seed::generate(size_t length, RandomSource& rng) {
        //Check the length
        checkLength(length);

        SecureBytes seed(length);
        rng.fill(seed.data(), seed.size());

        return seed;
    }

    SecureBytes Seed::generate(size_t length) {
        return generate(length, SystemRandom::instance());
    }
}
