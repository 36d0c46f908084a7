#include "../include/registry.hpp"
#include "../include/ed25519_algorithm.hpp"
#include "../include/logging.hpp"
#include "../include/null_algorithm.hpp"
#include "../include/secp256k1_algorithm.hpp"

/**
 * @file registry.cpp
 * @brief Implementation of the algorithm registry.
 */

namespace Sigil {

    AlgorithmRegistry::AlgorithmRegistry() {
        byId_[NULL_ID] = NullAlgorithm::instance();
        byId_[ED25519_ID] = Ed25519Algorithm::instance();
        byId_[SECP256K1_ID] = Secp256k1Algorithm::instance();
        rebuildNameIndex();
    }

    AlgorithmRegistry& AlgorithmRegistry::instance() {
        static AlgorithmRegistry registry;
        return registry;
    }

    void AlgorithmRegistry::registerAlgorithm(AlgorithmId id, AlgorithmPtr algorithm) {
        if (!algorithm) {
            throw RegistrationError("Cannot register a null algorithm");
        }
        if (id < FIRST_CUSTOM_ID) {
            SIGIL_LOG_WARN(LogCategory::REGISTRY) << "rejected " << algorithm->name()
                                                  << ": id " << static_cast<int>(id) << " is reserved";
            throw RegistrationError("Algorithm ids below " + std::to_string(FIRST_CUSTOM_ID) +
                                    " are reserved, got " + std::to_string(id));
        }

        // Sinks may call back into the registry, so log only after the lock is released.
        std::string name = algorithm->name();
        std::string bound;
        bool conflict = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto it = byId_.find(id);
            if (it == byId_.end()) {
                byId_[id] = std::move(algorithm);
                rebuildNameIndex();
            } else if (sameAlgorithm(*it->second, *algorithm)) {
                return;
            } else {
                conflict = true;
                bound = it->second->name();
            }
        }

        if (conflict) {
            SIGIL_LOG_WARN(LogCategory::REGISTRY) << "rejected " << name << ": id "
                                                  << static_cast<int>(id) << " is bound to " << bound;
            throw RegistrationError("Algorithm id " + std::to_string(id) + " is already bound to " + bound);
        }

        SIGIL_LOG_INFO(LogCategory::REGISTRY) << "registered " << name << " as id " << static_cast<int>(id);
    }

    AlgorithmPtr AlgorithmRegistry::lookup(AlgorithmId id) const {
        if (id == NULL_ID) {
            return NullAlgorithm::instance();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = byId_.find(id);
        if (it == byId_.end()) {
            throw UnknownAlgorithm("No algorithm registered with id " + std::to_string(id));
        }
        return it->second;
    }

    AlgorithmId AlgorithmRegistry::idOf(const Algorithm& algorithm) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = byName_.find(algorithm.name());
        if (it == byName_.end()) {
            throw UnknownAlgorithm("Algorithm " + algorithm.name() + " is not registered");
        }
        return it->second;
    }

    void AlgorithmRegistry::rebuildNameIndex() {
        byName_.clear();
        // lowest id wins when a name is bound more than once
        for (auto it = byId_.rbegin(); it != byId_.rend(); ++it) {
            byName_[it->second->name()] = it->first;
        }
    }

} // namespace Sigil
