#ifndef ED25519_ALGORITHM_HPP
#define ED25519_ALGORITHM_HPP

#include "algorithm.hpp"

/**
 * @file ed25519_algorithm.hpp
 * @brief EdDSA over Curve25519 (RFC 8032), backed by OpenSSL.
 */

namespace Sigil {

    /**
     * @class Ed25519Algorithm
     * @brief Ed25519 signatures.
     *
     * Private keys are 64 bytes: the 32-byte seed followed by the 32-byte
     * public key. Signing is deterministic.
     */
    class Ed25519Algorithm : public Algorithm {
    public:
        static constexpr int SEED_SIZE = 32;
        static constexpr int PUBLIC_KEY_SIZE = 32;
        static constexpr int PRIVATE_KEY_SIZE = 64;
        static constexpr int SIGNATURE_SIZE = 64;

        static AlgorithmPtr instance();

        std::string name() const override { return "Ed25519"; }

        int publicKeySize() const override { return PUBLIC_KEY_SIZE; }
        int privateKeySize() const override { return PRIVATE_KEY_SIZE; }
        int signatureSize() const override { return SIGNATURE_SIZE; }

        /**
         * @brief Reads SEED_SIZE bytes from rng and expands them into a keypair.
         */
        KeyPair generate(RandomSource& rng) const override;
        Bytes sign(const Bytes& privateKey, const Bytes& message) const override;
        bool verify(const Bytes& publicKey, const Bytes& message, const Bytes& signature) const override;
        Bytes derivePublic(const Bytes& privateKey) const override;
    };

} // namespace Sigil

#endif // ED25519_ALGORITHM_HPP
