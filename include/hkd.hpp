#ifndef HKD_HPP
#define HKD_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "exceptions.hpp"
#include "key.hpp"
#include "secure_memory.hpp"

/**
 * @file hkd.hpp
 * @brief BIP-32 style hierarchical key derivation over secp256k1.
 */

namespace Sigil {

    /**
     * @class HKD
     * @brief Protocol constants and the master-key routine shared by ExtendedKey
     * and the secp256k1 key generator.
     */
    class HKD {
    public:
        /// @brief Hardened derivation offset (2^31)
        static constexpr uint32_t HARDENED_OFFSET = 0x80000000;

        /// @brief HMAC key for master node generation.
        static constexpr const char* MASTER_KEY_DOMAIN = "ndau seed";

        /**
         * @brief A 32-byte private scalar and its 32-byte chain code.
         */
        struct NodeSecret {
            std::array<uint8_t, 32> key;       // private key (k)
            std::array<uint8_t, 32> chainCode; // entropy (c)

            void zeroize() {
                secure_memzero(key.data(), key.size());
                secure_memzero(chainCode.data(), chainCode.size());
            }
        };

        /**
         * @brief Derives the master scalar and chain code from a seed.
         *
         * I = HMAC-SHA512(key = MASTER_KEY_DOMAIN, data = seed).
         *
         * @param seed Seed bytes.
         * @param len Seed length, 16 to 64 bytes.
         * @throw InvalidLength If the seed length is out of range.
         * @throw UnusableValue If the left half of I is zero or not below the curve order.
         * @throw CryptoException If HMAC-SHA512 fails.
         */
        static NodeSecret computeMasterSecret(const uint8_t* seed, size_t len);

        /**
         * @brief First 3 bytes of SHA256(SHA256(publicKey)).
         */
        static std::array<uint8_t, 3> fingerprint(const Bytes& publicKey);

        /**
         * @brief Utility to check if an index is in the hardened range.
         */
        static constexpr bool isHardened(uint32_t index) {
            return (index & HARDENED_OFFSET) != 0;
        }

        /**
         * @brief Utility to apply the hardened offset to a standard index.
         */
        static constexpr uint32_t hardenIndex(uint32_t index) {
            return index | HARDENED_OFFSET;
        }
    };

    /**
     * @class ExtendedKey
     * @brief A node of the HD key tree.
     *
     * Private nodes hold a 32-byte scalar, public nodes a 33-byte compressed
     * point. The compressed public point of a private node is computed when
     * the node is built. Derivation never mutates the receiver.
     *
     * Nodes export to PublicKey / PrivateKey of the Secp256k1 algorithm with
     * the extra bytes depth(1) ++ parent fingerprint(3) ++ be32(index) ++
     * chain code(32).
     */
    class ExtendedKey {
    public:
        using ChainCode = std::array<uint8_t, 32>;
        using Fingerprint = std::array<uint8_t, 3>;

        static constexpr uint8_t MAX_DEPTH = 255;
        static constexpr size_t EXTRA_SIZE = 1 + 3 + 4 + 32;

        /**
         * @brief Build a node from its parts.
         * @throw InvalidLength If key is not 32 (private) or 33 (public) bytes.
         * @throw UnusableValue If a private key is not a valid scalar.
         */
        ExtendedKey(Bytes key, const ChainCode& chainCode, const Fingerprint& parentFingerprint,
                    uint8_t depth, uint32_t childIndex, bool isPrivate);
        ~ExtendedKey();

        ExtendedKey(const ExtendedKey&) = default;
        ExtendedKey& operator=(const ExtendedKey&) = default;
        ExtendedKey(ExtendedKey&&) = default;
        ExtendedKey& operator=(ExtendedKey&&) = default;

        /**
         * @brief Master node of a seed: depth 0, fingerprint 000000, index 0.
         * @throw InvalidLength If the seed is not 16 to 64 bytes.
         * @throw UnusableValue If the seed gives an out-of-range scalar.
         */
        static ExtendedKey newMaster(const uint8_t* seed, size_t len);
        static ExtendedKey newMaster(const Bytes& seed) { return newMaster(seed.data(), seed.size()); }
        static ExtendedKey newMaster(const SecureBytes& seed) { return newMaster(seed.data(), seed.size()); }

        /**
         * @brief Derive the child at index; indices >= HARDENED_OFFSET are hardened.
         * @throw DepthExceeded If this node is at depth 255.
         * @throw UnsupportedOperation For a hardened index on a public node.
         * @throw InvalidChild If the index yields an unusable key; try the next index.
         */
        ExtendedKey child(uint32_t index) const;

        /**
         * @brief child(n + HARDENED_OFFSET), wrapping in 32 bits.
         */
        ExtendedKey hardenedChild(uint32_t n) const;

        /**
         * @brief The public node with the same position in the tree.
         *
         * Returns a copy of the receiver if it is already public.
         */
        ExtendedKey publicKey() const;

        /**
         * @brief Derive the node at childPath from this node, which sits at parentPath.
         * @throw ParseFailure If a path is malformed or parentPath is not an ancestor of childPath.
         */
        ExtendedKey deriveFrom(const std::string& parentPath, const std::string& childPath) const;

        bool isPrivate() const { return isPrivate_; }
        uint8_t depth() const { return depth_; }
        uint32_t parentFingerprint() const;
        uint32_t childIndex() const { return childIndex_; }
        const ChainCode& chainCode() const { return chainCode_; }

        /// @brief Scalar of a private node, point of a public node.
        const Bytes& keyBytes() const { return key_; }
        const Bytes& publicKeyBytes() const { return publicKey_; }

        /// @brief Public key of this node with HD metadata in the extra bytes.
        PublicKey toPublicKey() const;

        /**
         * @throw UnsupportedOperation If this node is public.
         */
        PrivateKey toPrivateKey() const;

        /// @brief PrivateKey for private nodes, PublicKey otherwise.
        std::unique_ptr<Key> asSignatureKey() const;

        /**
         * @brief Rebuild a node from an exported key.
         * @throw UnsupportedOperation If the key is not a Secp256k1 key.
         * @throw InvalidLength If the extra bytes are shorter than EXTRA_SIZE.
         */
        static ExtendedKey fromSignatureKey(const Key& key);

        std::string toString() const;

        /**
         * @brief Parse an "npub" or "npvt" text produced by toString().
         */
        static ExtendedKey fromString(const std::string& text);

        /**
         * @brief Import the pre-container serialization:
         * B32(version(3) ++ depth ++ fp(3) ++ be32(index) ++ chain(32) ++ key(33) ++ check(4)).
         * @throw ParseFailure If the text is not base32 or the public point is invalid.
         * @throw InvalidLength If the decoded size is wrong.
         * @throw BadChecksum If the double SHA-256 checksum does not match.
         * @throw UnusableValue If the private scalar is out of range.
         */
        static ExtendedKey fromLegacySerialization(const std::string& text);

        /**
         * @brief Scrub all key material and leave an empty public node at depth 0.
         */
        void zeroize();

        bool operator==(const ExtendedKey& other) const;
        bool operator!=(const ExtendedKey& other) const { return !(*this == other); }

    private:
        Bytes extra() const;

        Bytes key_;
        Bytes publicKey_;
        ChainCode chainCode_;
        Fingerprint parentFP_;
        uint8_t depth_;
        uint32_t childIndex_;
        bool isPrivate_;
    };

} // namespace Sigil

#endif // HKD_HPP
