#include "../include/null_algorithm.hpp"

namespace Sigil {

    AlgorithmPtr NullAlgorithm::instance() {
        static const AlgorithmPtr algorithm = std::make_shared<NullAlgorithm>();
        return algorithm;
    }

    KeyPair NullAlgorithm::generate(RandomSource&) const {
        throw UnsupportedOperation("generating null keys is not permitted");
    }

    Bytes NullAlgorithm::sign(const Bytes&, const Bytes&) const {
        return Bytes();
    }

    bool NullAlgorithm::verify(const Bytes&, const Bytes&, const Bytes&) const {
        return false;
    }

    Bytes NullAlgorithm::derivePublic(const Bytes&) const {
        return Bytes();
    }

} // namespace Sigil
