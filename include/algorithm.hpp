#ifndef ALGORITHM_HPP
#define ALGORITHM_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "exceptions.hpp"
#include "random.hpp"
#include "secure_memory.hpp"

/**
 * @file algorithm.hpp
 * @brief Capability set implemented by every signature algorithm.
 */

namespace Sigil {

    /// @brief Small integer identifying an algorithm on the wire.
    using AlgorithmId = uint8_t;

    /**
     * @brief Raw key material produced by Algorithm::generate.
     */
    struct KeyPair {
        Bytes publicKey;
        Bytes privateKey;

        ~KeyPair() { secure_memzero(privateKey.data(), privateKey.size()); }
    };

    /**
     * @class Algorithm
     * @brief Low-level signature algorithm.
     *
     * Implementations are stateless and immutable. The methods work on raw
     * byte strings; the PublicKey, PrivateKey and Signature classes build the
     * typed interface on top of them.
     */
    class Algorithm {
    public:
        /// @brief Reported by signatureSize() when signatures have variable length.
        static constexpr int UNBOUNDED_SIZE = -1;

        virtual ~Algorithm() = default;

        /**
         * @brief Stable name used to decide whether two algorithms are the same.
         */
        virtual std::string name() const = 0;

        virtual int publicKeySize() const = 0;
        virtual int privateKeySize() const = 0;

        /**
         * @brief Signature size in bytes, or UNBOUNDED_SIZE.
         */
        virtual int signatureSize() const = 0;

        /**
         * @brief Create a new keypair from the given randomness source.
         * @throw UnsupportedOperation If the algorithm forbids generation.
         * @throw CryptoException If the randomness source fails.
         */
        virtual KeyPair generate(RandomSource& rng) const = 0;

        /**
         * @brief Sign message with privateKey.
         * @throw InvalidLength If privateKey has the wrong size.
         */
        virtual Bytes sign(const Bytes& privateKey, const Bytes& message) const = 0;

        /**
         * @brief Verify a signature. Never throws; malformed input is simply invalid.
         */
        virtual bool verify(const Bytes& publicKey, const Bytes& message, const Bytes& signature) const = 0;

        /**
         * @brief Public key matching privateKey.
         */
        virtual Bytes derivePublic(const Bytes& privateKey) const = 0;
    };

    using AlgorithmPtr = std::shared_ptr<const Algorithm>;

    /**
     * @brief True when both algorithms carry the same name, even if they are distinct instances.
     */
    inline bool sameAlgorithm(const Algorithm& a, const Algorithm& b) {
        return a.name() == b.name();
    }

} // namespace Sigil

#endif // ALGORITHM_HPP
