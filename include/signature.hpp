#ifndef SIGNATURE_HPP
#define SIGNATURE_HPP

#include <string>

#include "algorithm.hpp"
#include "exceptions.hpp"
#include "secure_memory.hpp"

/**
 * @file signature.hpp
 * @brief Algorithm-tagged signatures.
 */

namespace Sigil {

    class PublicKey;

    /**
     * @class Signature
     * @brief Signature bytes plus the algorithm that produced them.
     *
     * When the algorithm reports a non-negative signature size the byte length
     * must match it; Algorithm::UNBOUNDED_SIZE disables the check.
     *
     * The text form is B32(Checksum::add(marshal())) with no prefix.
     */
    class Signature {
    public:
        /// @brief Empty Null signature.
        Signature();

        /**
         * @throw InvalidLength If data does not have the algorithm's signature size.
         */
        Signature(AlgorithmPtr algorithm, Bytes data);

        const AlgorithmPtr& algorithm() const { return algorithm_; }
        const Bytes& bytes() const { return data_; }
        int size() const { return algorithm_->signatureSize(); }

        Bytes marshal() const;

        /**
         * @throw ParseFailure If the container is malformed or has trailing bytes.
         * @throw UnknownAlgorithm If the algorithm id is not registered.
         * @throw InvalidLength If the size does not match the algorithm.
         */
        void unmarshal(const Bytes& serialized);

        /**
         * @brief Decode the signature at the start of in.
         * @return The bytes that follow the signature.
         */
        Bytes unmarshalMsg(const Bytes& in);

        std::string marshalText() const;

        /**
         * @throw ParseFailure If the text is not valid base32.
         * @throw BadChecksum If the checksum does not match.
         */
        void unmarshalText(const std::string& text);

        static Signature parse(const std::string& text);

        bool verify(const Bytes& message, const PublicKey& key) const;

        bool operator==(const Signature& other) const;
        bool operator!=(const Signature& other) const { return !(*this == other); }

    private:
        void assign(AlgorithmId id, Bytes data);

        AlgorithmPtr algorithm_;
        Bytes data_;
    };

} // namespace Sigil

#endif // SIGNATURE_HPP
