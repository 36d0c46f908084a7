#ifndef KEY_HPP
#define KEY_HPP

#include <memory>
#include <string>
#include <utility>

#include "algorithm.hpp"
#include "exceptions.hpp"
#include "random.hpp"
#include "secure_memory.hpp"

/**
 * @file key.hpp
 * @brief Algorithm-tagged public and private keys with binary and text encodings.
 */

namespace Sigil {

    class Signature;

    /**
     * @class Key
     * @brief Raw key bytes, optional extra bytes and the algorithm they belong to.
     *
     * Key is the role-less base of PublicKey and PrivateKey. The extra bytes
     * carry HD metadata when a key is exported from an ExtendedKey.
     *
     * Binary form: Container[algorithm id, pack()] where
     * pack() = len(key) ++ key ++ extra.
     *
     * Text form: prefix ++ B32(Checksum::add(marshal())). The generic Key has
     * no prefix.
     *
     * Buffers are scrubbed on destruction.
     */
    class Key {
    public:
        /// @brief Empty key of the Null algorithm.
        Key();
        Key(AlgorithmPtr algorithm, Bytes key, Bytes extra = Bytes());
        virtual ~Key();

        Key(const Key&) = default;
        Key& operator=(const Key&) = default;
        Key(Key&&) = default;
        Key& operator=(Key&&) = default;

        const AlgorithmPtr& algorithm() const { return algorithm_; }
        const Bytes& keyBytes() const { return key_; }
        const Bytes& extraBytes() const { return extra_; }

        /**
         * @brief len(key) ++ key ++ extra.
         * @throw InvalidLength If the key is longer than 255 bytes.
         */
        Bytes pack() const;

        /**
         * @brief Inverse of pack(); replaces the key and extra bytes.
         * @throw InvalidLength If packed is empty or shorter than its declared key length.
         */
        void unpack(const Bytes& packed);

        Bytes marshal() const;

        /**
         * @brief Replace this key with the decoded container.
         *
         * On failure the key is left unchanged.
         * @throw ParseFailure If the container is malformed.
         * @throw UnknownAlgorithm If the algorithm id is not registered.
         * @throw InvalidLength If the key size does not match the algorithm.
         */
        void unmarshal(const Bytes& serialized);

        std::string marshalText() const;

        /**
         * @throw ParseFailure If the prefix or the base32 text is wrong.
         * @throw BadChecksum If the checksum does not match.
         * @throw InvalidLength If the key size does not match the algorithm.
         */
        void unmarshalText(const std::string& text);

        /**
         * @brief First 8 characters of the text form, "...", then the last 4.
         */
        std::string shortString() const;

        /// @brief Drop the extra bytes.
        void truncate();

        /**
         * @brief Overwrite key and extra bytes with zeros and reset to an empty Null key.
         */
        void zeroize();

        bool operator==(const Key& other) const;
        bool operator!=(const Key& other) const { return !(*this == other); }

    protected:
        /// @brief Text prefix of the concrete role.
        virtual const std::string& textPrefix() const;

        /// @brief Key size required by algorithm for this role, or -1 for no check.
        virtual int expectedSize(const Algorithm& algorithm) const;

        void checkSize() const;

    private:
        void decode(const Bytes& serialized, AlgorithmPtr& algorithm, Bytes& key, Bytes& extra) const;

        AlgorithmPtr algorithm_;
        Bytes key_;
        Bytes extra_;
    };

    /**
     * @class PublicKey
     * @brief The public half of a keypair. Text form starts with "npub".
     */
    class PublicKey : public Key {
    public:
        static const std::string PREFIX;

        PublicKey() = default;

        /**
         * @throw InvalidLength If key does not have the algorithm's public key size.
         */
        PublicKey(AlgorithmPtr algorithm, Bytes key, Bytes extra = Bytes());

        /// @brief Fast prefix test; a true result does not mean the text decodes.
        static bool maybe(const std::string& text);

        int size() const { return algorithm()->publicKeySize(); }

        /**
         * @brief False when the signature belongs to another algorithm or does not verify.
         */
        bool verify(const Bytes& message, const Signature& signature) const;

    protected:
        const std::string& textPrefix() const override;
        int expectedSize(const Algorithm& algorithm) const override;
    };

    /**
     * @class PrivateKey
     * @brief The private half of a keypair. Text form starts with "npvt".
     */
    class PrivateKey : public Key {
    public:
        static const std::string PREFIX;

        PrivateKey() = default;

        /**
         * @throw InvalidLength If key does not have the algorithm's private key size.
         */
        PrivateKey(AlgorithmPtr algorithm, Bytes key, Bytes extra = Bytes());

        static bool maybe(const std::string& text);

        int size() const { return algorithm()->privateKeySize(); }

        Signature sign(const Bytes& message) const;

        /**
         * @brief Matching public key, carrying the same extra bytes.
         */
        PublicKey publicKey() const;

    protected:
        const std::string& textPrefix() const override;
        int expectedSize(const Algorithm& algorithm) const override;
    };

    /**
     * @brief Generate a keypair.
     * @throw UnsupportedOperation For the Null algorithm.
     * @throw CryptoException If rng fails.
     */
    std::pair<PublicKey, PrivateKey> generate(const AlgorithmPtr& algorithm, RandomSource& rng);

    /// @brief Generate a keypair from the system CSPRNG.
    std::pair<PublicKey, PrivateKey> generate(const AlgorithmPtr& algorithm);

    /**
     * @brief Decode a key of either role, chosen by its text prefix.
     * @throw ParseFailure If the text starts with neither "npub" nor "npvt".
     */
    std::unique_ptr<Key> parseKey(const std::string& text);

    bool isPublic(const Key& key);
    bool isPrivate(const Key& key);

    /**
     * @brief Sign 64 random bytes with priv and verify them with pub.
     */
    bool keysMatch(const PublicKey& pub, const PrivateKey& priv);

} // namespace Sigil

#endif // KEY_HPP
