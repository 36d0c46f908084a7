#include "../include/hash.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

/**
 * @file hash.cpp
 * @brief OpenSSL backed digest helpers.
 */

namespace Sigil {

    Hash::Digest224 Hash::sha224(const uint8_t* data, size_t len) {
        Digest224 out;
        SHA224(data, len, out.data());
        return out;
    }

    Hash::Digest256 Hash::sha256(const uint8_t* data, size_t len) {
        Digest256 out;
        SHA256(data, len, out.data());
        return out;
    }

    Hash::Digest256 Hash::doubleSha256(const uint8_t* data, size_t len) {
        Digest256 first = sha256(data, len);
        return sha256(first.data(), first.size());
    }

    Hash::Digest512 Hash::hmacSha512(const uint8_t* key, size_t keyLen,
                                     const uint8_t* data, size_t dataLen) {
        Digest512 out;
        unsigned int outLen = 0;

        if (HMAC(EVP_sha512(), key, static_cast<int>(keyLen),
                 data, dataLen, out.data(), &outLen) == nullptr || outLen != out.size()) {
            secure_memzero(out.data(), out.size());
            throw CryptoException("HMAC-SHA512 computation failed");
        }

        return out;
    }

} // namespace Sigil
