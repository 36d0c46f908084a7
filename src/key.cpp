#include "../include/key.hpp"
#include "../include/b32.hpp"
#include "../include/checksum.hpp"
#include "../include/container.hpp"
#include "../include/logging.hpp"
#include "../include/null_algorithm.hpp"
#include "../include/registry.hpp"
#include "../include/signature.hpp"

#include <memory>
#include <typeinfo>

/**
 * @file key.cpp
 * @brief Implementation of Key, PublicKey and PrivateKey.
 */

namespace Sigil {

    namespace {

        void unpackInto(const Bytes& packed, Bytes& key, Bytes& extra) {
            if (packed.empty()) {
                throw InvalidLength("Cannot unpack an empty key buffer");
            }
            size_t keyLen = packed[0];
            if (packed.size() - 1 < keyLen) {
                throw InvalidLength("Packed key declares " + std::to_string(keyLen) +
                                    " key bytes but only " + std::to_string(packed.size() - 1) +
                                    " are available");
            }
            key.assign(packed.begin() + 1, packed.begin() + 1 + keyLen);
            extra.assign(packed.begin() + 1 + keyLen, packed.end());
        }
    }

    const std::string PublicKey::PREFIX = "npub";
    const std::string PrivateKey::PREFIX = "npvt";

    Key::Key() : algorithm_(NullAlgorithm::instance()) {}

    Key::Key(AlgorithmPtr algorithm, Bytes key, Bytes extra)
        : algorithm_(algorithm ? std::move(algorithm) : NullAlgorithm::instance()),
          key_(std::move(key)),
          extra_(std::move(extra)) {}

    Key::~Key() {
        secure_memzero(key_.data(), key_.size());
        secure_memzero(extra_.data(), extra_.size());
    }

    const std::string& Key::textPrefix() const {
        static const std::string none;
        return none;
    }

    int Key::expectedSize(const Algorithm&) const {
        return -1;
    }

    void Key::checkSize() const {
        int expected = expectedSize(*algorithm_);
        if (expected >= 0 && key_.size() != static_cast<size_t>(expected)) {
            throw InvalidLength("Wrong size " + algorithm_->name() + " key: expected " +
                                std::to_string(expected) + " bytes, got " + std::to_string(key_.size()));
        }
    }

    Bytes Key::pack() const {
        if (key_.size() > 0xff) {
            throw InvalidLength("Key of " + std::to_string(key_.size()) + " bytes is too long to pack");
        }

        Bytes packed;
        packed.reserve(1 + key_.size() + extra_.size());
        packed.push_back(static_cast<uint8_t>(key_.size()));
        packed.insert(packed.end(), key_.begin(), key_.end());
        packed.insert(packed.end(), extra_.begin(), extra_.end());
        return packed;
    }

    void Key::unpack(const Bytes& packed) {
        Bytes key, extra;
        unpackInto(packed, key, extra);
        secure_memzero(key_.data(), key_.size());
        secure_memzero(extra_.data(), extra_.size());
        key_ = std::move(key);
        extra_ = std::move(extra);
    }

    Bytes Key::marshal() const {
        IdentifiedData value;
        value.algorithm = AlgorithmRegistry::instance().idOf(*algorithm_);
        value.data = pack();

        Bytes out = Container::marshal(value);
        secure_memzero(value.data.data(), value.data.size());
        return out;
    }

    void Key::decode(const Bytes& serialized, AlgorithmPtr& algorithm, Bytes& key, Bytes& extra) const {
        IdentifiedData value = Container::unmarshal(serialized);
        algorithm = AlgorithmRegistry::instance().lookup(value.algorithm);
        unpackInto(value.data, key, extra);
        secure_memzero(value.data.data(), value.data.size());

        int expected = expectedSize(*algorithm);
        if (expected >= 0 && key.size() != static_cast<size_t>(expected)) {
            secure_memzero(key.data(), key.size());
            throw InvalidLength("Wrong size " + algorithm->name() + " key: expected " +
                                std::to_string(expected) + " bytes, got " + std::to_string(key.size()));
        }
    }

    void Key::unmarshal(const Bytes& serialized) {
        AlgorithmPtr algorithm;
        Bytes key, extra;
        decode(serialized, algorithm, key, extra);

        zeroize();
        algorithm_ = std::move(algorithm);
        key_ = std::move(key);
        extra_ = std::move(extra);
    }

    std::string Key::marshalText() const {
        Bytes framed = Checksum::add(marshal());
        std::string text = textPrefix() + B32::encode(framed);
        secure_memzero(framed.data(), framed.size());
        return text;
    }

    void Key::unmarshalText(const std::string& text) {
        const std::string& prefix = textPrefix();
        if (text.compare(0, prefix.size(), prefix) != 0) {
            throw ParseFailure("Key text must begin with \"" + prefix + "\"");
        }

        Bytes framed = B32::decode(text.substr(prefix.size()));
        Bytes payload;
        bool ok = Checksum::check(framed, payload);
        secure_memzero(framed.data(), framed.size());
        if (!ok) {
            SIGIL_LOG_DEBUG(LogCategory::KEYS) << "checksum mismatch decoding key text";
            throw BadChecksum("Key text failed its checksum");
        }

        try {
            unmarshal(payload);
        } catch (...) {
            secure_memzero(payload.data(), payload.size());
            throw;
        }
        secure_memzero(payload.data(), payload.size());
    }

    std::string Key::shortString() const {
        std::string text = marshalText();
        if (text.size() <= 12) {
            return text;
        }
        return text.substr(0, 8) + "..." + text.substr(text.size() - 4);
    }

    void Key::truncate() {
        secure_clear(extra_);
    }

    void Key::zeroize() {
        secure_clear(key_);
        secure_clear(extra_);
        algorithm_ = NullAlgorithm::instance();
    }

    bool Key::operator==(const Key& other) const {
        return typeid(*this) == typeid(other) &&
               sameAlgorithm(*algorithm_, *other.algorithm_) &&
               key_ == other.key_ &&
               extra_ == other.extra_;
    }

    PublicKey::PublicKey(AlgorithmPtr algorithm, Bytes key, Bytes extra)
        : Key(std::move(algorithm), std::move(key), std::move(extra)) {
        checkSize();
    }

    bool PublicKey::maybe(const std::string& text) {
        return text.compare(0, PREFIX.size(), PREFIX) == 0;
    }

    bool PublicKey::verify(const Bytes& message, const Signature& signature) const {
        if (!sameAlgorithm(*algorithm(), *signature.algorithm())) {
            return false;
        }
        return algorithm()->verify(keyBytes(), message, signature.bytes());
    }

    const std::string& PublicKey::textPrefix() const {
        return PREFIX;
    }

    int PublicKey::expectedSize(const Algorithm& algorithm) const {
        return algorithm.publicKeySize();
    }

    PrivateKey::PrivateKey(AlgorithmPtr algorithm, Bytes key, Bytes extra)
        : Key(std::move(algorithm), std::move(key), std::move(extra)) {
        checkSize();
    }

    bool PrivateKey::maybe(const std::string& text) {
        return text.compare(0, PREFIX.size(), PREFIX) == 0;
    }

    Signature PrivateKey::sign(const Bytes& message) const {
        return Signature(algorithm(), algorithm()->sign(keyBytes(), message));
    }

    PublicKey PrivateKey::publicKey() const {
        return PublicKey(algorithm(), algorithm()->derivePublic(keyBytes()), extraBytes());
    }

    const std::string& PrivateKey::textPrefix() const {
        return PREFIX;
    }

    int PrivateKey::expectedSize(const Algorithm& algorithm) const {
        return algorithm.privateKeySize();
    }

    std::pair<PublicKey, PrivateKey> generate(const AlgorithmPtr& algorithm, RandomSource& rng) {
        KeyPair pair = algorithm->generate(rng);
        return std::make_pair(PublicKey(algorithm, pair.publicKey),
                              PrivateKey(algorithm, pair.privateKey));
    }

    std::pair<PublicKey, PrivateKey> generate(const AlgorithmPtr& algorithm) {
        return generate(algorithm, SystemRandom::instance());
    }

    std::unique_ptr<Key> parseKey(const std::string& text) {
        if (PrivateKey::maybe(text)) {
            std::unique_ptr<Key> key = std::make_unique<PrivateKey>();
            key->unmarshalText(text);
            return key;
        }
        if (PublicKey::maybe(text)) {
            std::unique_ptr<Key> key = std::make_unique<PublicKey>();
            key->unmarshalText(text);
            return key;
        }
        throw ParseFailure("Text does not appear to be a key");
    }

    bool isPublic(const Key& key) {
        return dynamic_cast<const PublicKey*>(&key) != nullptr;
    }

    bool isPrivate(const Key& key) {
        return dynamic_cast<const PrivateKey*>(&key) != nullptr;
    }

    bool keysMatch(const PublicKey& pub, const PrivateKey& priv) {
        Bytes data(64);
        SystemRandom::instance().fill(data.data(), data.size());
        Signature signature = priv.sign(data);
        return pub.verify(data, signature);
    }

} // namespace Sigil
