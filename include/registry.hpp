#ifndef REGISTRY_HPP
#define REGISTRY_HPP

#include <map>
#include <mutex>
#include <string>

#include "algorithm.hpp"
#include "exceptions.hpp"

/**
 * @file registry.hpp
 * @brief Process-wide table binding algorithm ids to algorithms.
 */

namespace Sigil {

    /**
     * @class AlgorithmRegistry
     * @brief Maps the small integer ids used on the wire to Algorithm instances.
     *
     * The built-in bindings are 0 = Null, 1 = Ed25519 and 2 = Secp256k1. Ids
     * from FIRST_CUSTOM_ID upwards are available to callers.
     */
    class AlgorithmRegistry {
    public:
        static constexpr AlgorithmId NULL_ID = 0;
        static constexpr AlgorithmId ED25519_ID = 1;
        static constexpr AlgorithmId SECP256K1_ID = 2;
        static constexpr AlgorithmId FIRST_CUSTOM_ID = 128;

        static AlgorithmRegistry& instance();

        /**
         * @brief Bind id to algorithm.
         *
         * Registering an algorithm again under the same id is a no-op when the
         * names match.
         *
         * @throw RegistrationError If id is below FIRST_CUSTOM_ID, is already bound
         * to a differently named algorithm, or if algorithm is null.
         */
        void registerAlgorithm(AlgorithmId id, AlgorithmPtr algorithm);

        /**
         * @brief Algorithm bound to id. Id 0 always resolves to Null.
         * @throw UnknownAlgorithm If nothing is bound to id.
         */
        AlgorithmPtr lookup(AlgorithmId id) const;

        /**
         * @brief Id of the algorithm with the same name as algorithm.
         * @throw UnknownAlgorithm If the name is not registered.
         */
        AlgorithmId idOf(const Algorithm& algorithm) const;

    private:
        AlgorithmRegistry();

        AlgorithmRegistry(const AlgorithmRegistry&) = delete;
        AlgorithmRegistry& operator=(const AlgorithmRegistry&) = delete;

        void rebuildNameIndex();

        mutable std::mutex mutex_;
        std::map<AlgorithmId, AlgorithmPtr> byId_;
        std::map<std::string, AlgorithmId> byName_;
    };

} // namespace Sigil

#endif // REGISTRY_HPP
