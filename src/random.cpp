#include "../include/random.hpp"

#include <openssl/rand.h>

#include <climits>
#include <cstring>

/**
 * @file random.cpp
 * @brief Implementation of the randomness sources.
 */

namespace Sigil {

    void SystemRandom::fill(uint8_t* out, size_t len) {
        while (len > 0) {
            int chunk = len > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);
            if (RAND_bytes(out, chunk) != 1)
                throw CryptoException("CSPRNG entropy generation failed.");
            out += chunk;
            len -= static_cast<size_t>(chunk);
        }
    }

    SystemRandom& SystemRandom::instance() {
        static SystemRandom rng;
        return rng;
    }

    BufferRandom::BufferRandom(const uint8_t* data, size_t len)
        : buffer_(data, data + len), offset_(0) {}

    BufferRandom::BufferRandom(const Bytes& data)
        : buffer_(data.begin(), data.end()), offset_(0) {}

    void BufferRandom::fill(uint8_t* out, size_t len) {
        if (len > remaining())
            throw CryptoException("Randomness source exhausted");

        std::memcpy(out, buffer_.data() + offset_, len);
        offset_ += len;
    }

} // namespace Sigil
