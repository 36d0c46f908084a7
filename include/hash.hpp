#ifndef HASH_HPP
#define HASH_HPP

#include <array>
#include <cstddef>
#include <cstdint>

#include "exceptions.hpp"
#include "secure_memory.hpp"

/**
 * @file hash.hpp
 * @brief Thin wrappers over the OpenSSL digests used by the library.
 */

namespace Sigil {

    /**
     * @class Hash
     * @brief SHA-224, SHA-256, double SHA-256 and HMAC-SHA512 helpers.
     */
    class Hash {
    public:
        using Digest224 = std::array<uint8_t, 28>;
        using Digest256 = std::array<uint8_t, 32>;
        using Digest512 = std::array<uint8_t, 64>;

        static Digest224 sha224(const uint8_t* data, size_t len);
        static Digest256 sha256(const uint8_t* data, size_t len);

        /**
         * @brief SHA-256 applied twice: SHA256(SHA256(data)).
         */
        static Digest256 doubleSha256(const uint8_t* data, size_t len);

        /**
         * @brief HMAC-SHA512 of data under key.
         * @throw CryptoException If the OpenSSL HMAC call fails.
         */
        static Digest512 hmacSha512(const uint8_t* key, size_t keyLen,
                                    const uint8_t* data, size_t dataLen);

        static Digest224 sha224(const Bytes& data) { return sha224(data.data(), data.size()); }
        static Digest256 sha256(const Bytes& data) { return sha256(data.data(), data.size()); }
        static Digest256 doubleSha256(const Bytes& data) { return doubleSha256(data.data(), data.size()); }
    };

} // namespace Sigil

#endif // HASH_HPP
