#include "../include/signature.hpp"
#include "../include/b32.hpp"
#include "../include/checksum.hpp"
#include "../include/container.hpp"
#include "../include/key.hpp"
#include "../include/logging.hpp"
#include "../include/null_algorithm.hpp"
#include "../include/registry.hpp"

namespace Sigil {

    namespace {

        void checkSignatureSize(const Algorithm& algorithm, size_t len) {
            int expected = algorithm.signatureSize();
            if (expected >= 0 && len != static_cast<size_t>(expected)) {
                throw InvalidLength("Wrong size " + algorithm.name() + " signature: expected " +
                                    std::to_string(expected) + " bytes, got " + std::to_string(len));
            }
        }
    }

    Signature::Signature() : algorithm_(NullAlgorithm::instance()) {}

    Signature::Signature(AlgorithmPtr algorithm, Bytes data)
        : algorithm_(algorithm ? std::move(algorithm) : NullAlgorithm::instance()),
          data_(std::move(data)) {
        checkSignatureSize(*algorithm_, data_.size());
    }

    Bytes Signature::marshal() const {
        IdentifiedData value;
        value.algorithm = AlgorithmRegistry::instance().idOf(*algorithm_);
        value.data = data_;
        return Container::marshal(value);
    }

    void Signature::assign(AlgorithmId id, Bytes data) {
        AlgorithmPtr algorithm = AlgorithmRegistry::instance().lookup(id);
        checkSignatureSize(*algorithm, data.size());
        algorithm_ = std::move(algorithm);
        data_ = std::move(data);
    }

    void Signature::unmarshal(const Bytes& serialized) {
        IdentifiedData value = Container::unmarshal(serialized);
        assign(value.algorithm, std::move(value.data));
    }

    Bytes Signature::unmarshalMsg(const Bytes& in) {
        size_t consumed = 0;
        IdentifiedData value = Container::unmarshalPrefix(in.data(), in.size(), consumed);
        assign(value.algorithm, std::move(value.data));
        return Bytes(in.begin() + consumed, in.end());
    }

    std::string Signature::marshalText() const {
        return B32::encode(Checksum::add(marshal()));
    }

    void Signature::unmarshalText(const std::string& text) {
        Bytes payload;
        if (!Checksum::check(B32::decode(text), payload)) {
            SIGIL_LOG_DEBUG(LogCategory::KEYS) << "checksum mismatch decoding signature text";
            throw BadChecksum("Signature text failed its checksum");
        }
        unmarshal(payload);
    }

    Signature Signature::parse(const std::string& text) {
        Signature signature;
        signature.unmarshalText(text);
        return signature;
    }

    bool Signature::verify(const Bytes& message, const PublicKey& key) const {
        return key.verify(message, *this);
    }

    bool Signature::operator==(const Signature& other) const {
        return sameAlgorithm(*algorithm_, *other.algorithm_) && data_ == other.data_;
    }

} // namespace Sigil
