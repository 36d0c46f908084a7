#ifndef NULL_ALGORITHM_HPP
#define NULL_ALGORITHM_HPP

#include "algorithm.hpp"

/**
 * @file null_algorithm.hpp
 * @brief The empty algorithm: zero-length keys and signatures.
 */

namespace Sigil {

    /**
     * @class NullAlgorithm
     * @brief Placeholder algorithm for absent keys.
     *
     * Generation is forbidden, signatures are empty and never verify.
     */
    class NullAlgorithm : public Algorithm {
    public:
        static AlgorithmPtr instance();

        std::string name() const override { return "Null"; }

        int publicKeySize() const override { return 0; }
        int privateKeySize() const override { return 0; }
        int signatureSize() const override { return 0; }

        KeyPair generate(RandomSource& rng) const override;
        Bytes sign(const Bytes& privateKey, const Bytes& message) const override;
        bool verify(const Bytes& publicKey, const Bytes& message, const Bytes& signature) const override;
        Bytes derivePublic(const Bytes& privateKey) const override;
    };

} // namespace Sigil

#endif // NULL_ALGORITHM_HPP
