#include "../include/checksum.hpp"
#include "../include/hash.hpp"

/**
 * @file checksum.cpp
 * @brief Implementation of the truncated SHA-224 checksum.
 */

namespace Sigil {

    uint8_t Checksum::width(size_t inputLen) {
        // The framed output gains one extra leading byte holding the width
        size_t framed = inputLen + 1;
        size_t fill = PAD_WIDTH - (framed % PAD_WIDTH);
        if (fill < MIN_BYTES) {
            fill += PAD_WIDTH;
        }
        return static_cast<uint8_t>(fill);
    }

    Bytes Checksum::compute(const uint8_t* data, size_t len, uint8_t n) {
        Hash::Digest224 sum = Hash::sha224(data, len);
        if (n > sum.size()) n = static_cast<uint8_t>(sum.size());
        return Bytes(sum.end() - n, sum.end());
    }

    Bytes Checksum::add(const Bytes& payload) {
        uint8_t n = width(payload.size());
        Bytes sum = compute(payload.data(), payload.size(), n);

        Bytes out;
        out.reserve(1 + payload.size() + n);
        out.push_back(n);
        out.insert(out.end(), payload.begin(), payload.end());
        out.insert(out.end(), sum.begin(), sum.end());
        return out;
    }

    bool Checksum::check(const Bytes& framed, Bytes& payload) {
        if (framed.size() < 1 + MIN_BYTES) {
            return false;
        }

        size_t n = framed[0];
        if (n < MIN_BYTES || n > Hash::Digest224().size() || framed.size() < 1 + n) {
            return false;
        }

        size_t messageLen = framed.size() - 1 - n;
        Bytes expected = compute(framed.data() + 1, messageLen, static_cast<uint8_t>(n));
        if (!constant_time_equal(expected.data(), framed.data() + 1 + messageLen, n)) {
            return false;
        }

        payload.assign(framed.begin() + 1, framed.begin() + 1 + messageLen);
        return true;
    }

} // namespace Sigil
