#ifndef RANDOM_HPP
#define RANDOM_HPP

#include <cstddef>
#include <cstdint>

#include "exceptions.hpp"
#include "secure_memory.hpp"

/**
 * @file random.hpp
 * @brief Randomness sources consumed by key generation.
 */

namespace Sigil {

    /**
     * @class RandomSource
     * @brief Caller-supplied source of random bytes.
     */
    class RandomSource {
    public:
        virtual ~RandomSource() = default;

        /**
         * @brief Fill out[0..len) with random bytes.
         * @throw CryptoException If the source cannot provide len bytes.
         */
        virtual void fill(uint8_t* out, size_t len) = 0;
    };

    /**
     * @class SystemRandom
     * @brief CSPRNG backed by OpenSSL RAND_bytes.
     */
    class SystemRandom : public RandomSource {
    public:
        void fill(uint8_t* out, size_t len) override;

        /// @brief Shared instance used when the caller does not supply a source.
        static SystemRandom& instance();
    };

    /**
     * @class BufferRandom
     * @brief Replays a fixed byte sequence; used for deterministic generation.
     *
     * Reading past the end of the buffer throws instead of wrapping around.
     */
    class BufferRandom : public RandomSource {
    public:
        explicit BufferRandom(const uint8_t* data, size_t len);
        explicit BufferRandom(const Bytes& data);

        void fill(uint8_t* out, size_t len) override;

        size_t remaining() const { return buffer_.size() - offset_; }

    private:
        SecureBytes buffer_;
        size_t offset_;
    };

} // namespace Sigil

#endif // RANDOM_HPP
