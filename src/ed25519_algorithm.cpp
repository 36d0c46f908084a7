#include "../include/ed25519_algorithm.hpp"

#include <openssl/evp.h>

#include <memory>

/**
 * @file ed25519_algorithm.cpp
 * @brief Ed25519 through the OpenSSL EVP interface.
 */

namespace Sigil {

    namespace {

        using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
        using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

        /**
         * @brief Load the 32-byte seed into an OpenSSL key object.
         * @throw CryptoException If OpenSSL rejects the seed.
         */
        PKeyPtr privateFromSeed(const uint8_t* seed) {
            PKeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed,
                                                      Ed25519Algorithm::SEED_SIZE),
                         EVP_PKEY_free);
            if (!pkey) {
                throw CryptoException("Failure to load the Ed25519 private key");
            }
            return pkey;
        }

        // OpenSSL wants a valid pointer even for an empty message
        const uint8_t* bytesOf(const Bytes& b) {
            static const uint8_t empty = 0;
            return b.empty() ? &empty : b.data();
        }

        Bytes rawPublic(EVP_PKEY* pkey) {
            Bytes pub(Ed25519Algorithm::PUBLIC_KEY_SIZE);
            size_t pubLen = pub.size();
            if (EVP_PKEY_get_raw_public_key(pkey, pub.data(), &pubLen) != 1 || pubLen != pub.size()) {
                throw CryptoException("Failure to extract the Ed25519 public key");
            }
            return pub;
        }
    }

    AlgorithmPtr Ed25519Algorithm::instance() {
        static const AlgorithmPtr algorithm = std::make_shared<Ed25519Algorithm>();
        return algorithm;
    }

    KeyPair Ed25519Algorithm::generate(RandomSource& rng) const {
        SecureBytes seed(SEED_SIZE);
        rng.fill(seed.data(), seed.size());

        PKeyPtr pkey = privateFromSeed(seed.data());

        KeyPair pair;
        pair.publicKey = rawPublic(pkey.get());

        // private = seed || public
        pair.privateKey.reserve(PRIVATE_KEY_SIZE);
        pair.privateKey.insert(pair.privateKey.end(), seed.begin(), seed.end());
        pair.privateKey.insert(pair.privateKey.end(), pair.publicKey.begin(), pair.publicKey.end());

        return pair;
    }

    Bytes Ed25519Algorithm::sign(const Bytes& privateKey, const Bytes& message) const {
        if (privateKey.size() != static_cast<size_t>(PRIVATE_KEY_SIZE)) {
            throw InvalidLength("Ed25519 private key must be " + std::to_string(PRIVATE_KEY_SIZE) +
                                " bytes, got " + std::to_string(privateKey.size()));
        }

        PKeyPtr pkey = privateFromSeed(privateKey.data());
        MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
        if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
            throw CryptoException("Failure to initialise Ed25519 signing");
        }

        Bytes signature(SIGNATURE_SIZE);
        size_t sigLen = signature.size();
        if (EVP_DigestSign(ctx.get(), signature.data(), &sigLen, bytesOf(message), message.size()) != 1 ||
            sigLen != signature.size()) {
            throw CryptoException("Ed25519 signing failed");
        }

        return signature;
    }

    bool Ed25519Algorithm::verify(const Bytes& publicKey, const Bytes& message, const Bytes& signature) const {
        if (publicKey.size() != static_cast<size_t>(PUBLIC_KEY_SIZE) ||
            signature.size() != static_cast<size_t>(SIGNATURE_SIZE)) {
            return false;
        }

        PKeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, publicKey.data(), publicKey.size()),
                     EVP_PKEY_free);
        if (!pkey) {
            return false;
        }

        MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
        if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
            return false;
        }

        return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                                bytesOf(message), message.size()) == 1;
    }

    Bytes Ed25519Algorithm::derivePublic(const Bytes& privateKey) const {
        if (privateKey.size() < static_cast<size_t>(SEED_SIZE)) {
            throw InvalidLength("Ed25519 private key too short: " + std::to_string(privateKey.size()));
        }

        PKeyPtr pkey = privateFromSeed(privateKey.data());
        return rawPublic(pkey.get());
    }

} // namespace Sigil
