#ifndef SECP256K1_ALGORITHM_HPP
#define SECP256K1_ALGORITHM_HPP

#include "algorithm.hpp"

/**
 * @file secp256k1_algorithm.hpp
 * @brief ECDSA over secp256k1, backed by libsecp256k1.
 */

namespace Sigil {

    /**
     * @class Secp256k1Algorithm
     * @brief secp256k1 ECDSA with compressed public keys and DER signatures.
     *
     * Messages are hashed with SHA-256 before signing. Nonces follow RFC 6979,
     * so signing is deterministic.
     *
     * The static helpers expose the curve operations needed by the HD key
     * derivation without leaking libsecp256k1 types into the headers.
     */
    class Secp256k1Algorithm : public Algorithm {
    public:
        static constexpr int PUBLIC_KEY_SIZE = 33;
        static constexpr int PRIVATE_KEY_SIZE = 32;

        static AlgorithmPtr instance();

        std::string name() const override { return "Secp256k1"; }

        int publicKeySize() const override { return PUBLIC_KEY_SIZE; }
        int privateKeySize() const override { return PRIVATE_KEY_SIZE; }
        int signatureSize() const override { return UNBOUNDED_SIZE; }

        /**
         * @brief Draws a 32-byte seed from rng and returns the HD master node of that seed.
         * @throw UnusableValue If the seed yields an out-of-range scalar.
         */
        KeyPair generate(RandomSource& rng) const override;

        /**
         * @brief DER-encoded ECDSA signature over SHA-256(message).
         * @throw InvalidLength If privateKey is not 32 bytes.
         * @throw UnusableValue If privateKey is not a valid scalar.
         */
        Bytes sign(const Bytes& privateKey, const Bytes& message) const override;
        bool verify(const Bytes& publicKey, const Bytes& message, const Bytes& signature) const override;
        Bytes derivePublic(const Bytes& privateKey) const override;

        /**
         * @brief True when the 32 bytes at scalar are in [1, n).
         */
        static bool isValidScalar(const uint8_t* scalar);

        /**
         * @brief True when point parses as a public key on the curve.
         */
        static bool isValidPublicKey(const uint8_t* point, size_t len);

        /**
         * @brief Compressed public key k*G of a 32-byte scalar.
         * @throw UnusableValue If the scalar is zero or not below the curve order.
         */
        static Bytes publicFromPrivate(const uint8_t* scalar);

        /**
         * @brief scalar := (scalar + tweak) mod n, in place.
         * @return false if the tweak is out of range or the result is zero.
         */
        static bool tweakAddPrivate(uint8_t* scalar, const uint8_t* tweak);

        /**
         * @brief point := point + tweak*G, re-serialized compressed.
         * @return false if point does not parse, the tweak is out of range or
         * the sum is the point at infinity.
         */
        static bool tweakAddPublic(Bytes& point, const uint8_t* tweak);
    };

} // namespace Sigil

#endif // SECP256K1_ALGORITHM_HPP
