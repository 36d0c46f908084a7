#include "../include/hkd.hpp"
#include "../include/b32.hpp"
#include "../include/hash.hpp"
#include "../include/logging.hpp"
#include "../include/secp256k1_algorithm.hpp"
#include "../include/seed.hpp"

#include <algorithm>
#include <cstring>

/**
 * @file hkd.cpp
 * @brief Implementation of the master-key routine and ExtendedKey derivation.
 */

namespace Sigil {

    HKD::NodeSecret HKD::computeMasterSecret(const uint8_t* seed, size_t len) {
        Seed::checkLength(len);

        // HMAC-SHA512(Key="ndau seed", Data=seed)
        Hash::Digest512 I = Hash::hmacSha512(reinterpret_cast<const uint8_t*>(MASTER_KEY_DOMAIN),
                                             std::strlen(MASTER_KEY_DOMAIN), seed, len);

        NodeSecret master;
        // Left 32 bytes: master private key / Right 32 bytes: master chain code
        std::copy(I.begin(), I.begin() + 32, master.key.begin());
        std::copy(I.begin() + 32, I.end(), master.chainCode.begin());

        // Clean up sensitive intermediate data
        secure_memzero(I.data(), I.size());

        if (!Secp256k1Algorithm::isValidScalar(master.key.data())) {
            master.zeroize();
            SIGIL_LOG_DEBUG(LogCategory::HD) << "seed produced an unusable master key";
            throw UnusableValue("Unusable seed");
        }

        return master;
    }

    std::array<uint8_t, 3> HKD::fingerprint(const Bytes& publicKey) {
        Hash::Digest256 first = Hash::sha256(publicKey);
        return B32::checksum24(first.data(), first.size());
    }

    ExtendedKey::ExtendedKey(Bytes key, const ChainCode& chainCode, const Fingerprint& parentFingerprint,
                             uint8_t depth, uint32_t childIndex, bool isPrivate)
        : key_(std::move(key)),
          chainCode_(chainCode),
          parentFP_(parentFingerprint),
          depth_(depth),
          childIndex_(childIndex),
          isPrivate_(isPrivate) {
        size_t expected = isPrivate_ ? Secp256k1Algorithm::PRIVATE_KEY_SIZE : Secp256k1Algorithm::PUBLIC_KEY_SIZE;
        if (key_.size() != expected) {
            size_t got = key_.size();
            zeroize();
            throw InvalidLength("Extended key must hold " + std::to_string(expected) + " key bytes, got " +
                                std::to_string(got));
        }

        if (isPrivate_) {
            try {
                publicKey_ = Secp256k1Algorithm::publicFromPrivate(key_.data());
            } catch (const UnusableValue&) {
                zeroize();
                throw;
            }
        } else {
            publicKey_ = key_;
        }
    }

    ExtendedKey::~ExtendedKey() {
        secure_memzero(key_.data(), key_.size());
        secure_memzero(chainCode_.data(), chainCode_.size());
    }

    ExtendedKey ExtendedKey::newMaster(const uint8_t* seed, size_t len) {
        HKD::NodeSecret master = HKD::computeMasterSecret(seed, len);

        Bytes key(master.key.begin(), master.key.end());
        ChainCode chainCode = master.chainCode;
        master.zeroize();

        ExtendedKey node(std::move(key), chainCode, Fingerprint{{0, 0, 0}}, 0, 0, true);
        secure_memzero(chainCode.data(), chainCode.size());
        return node;
    }

    ExtendedKey ExtendedKey::child(uint32_t index) const {
        if (depth_ == MAX_DEPTH) {
            throw DepthExceeded("Cannot derive a key with more than 255 indices in its path");
        }

        bool hardened = HKD::isHardened(index);
        if (!isPrivate_ && hardened) {
            throw UnsupportedOperation("Cannot derive a hardened key from a public key");
        }

        // 0x00 || k || index (hardened) or K || index (normal), 37 bytes either way
        SecureBytes data;
        data.reserve(37);
        if (hardened) {
            data.push_back(0x00);
            data.insert(data.end(), key_.begin(), key_.end());
        } else {
            data.insert(data.end(), publicKey_.begin(), publicKey_.end());
        }

        // We add the index in BIG ENDIAN
        data.push_back(static_cast<uint8_t>((index >> 24) & 0xFF));
        data.push_back(static_cast<uint8_t>((index >> 16) & 0xFF));
        data.push_back(static_cast<uint8_t>((index >> 8) & 0xFF));
        data.push_back(static_cast<uint8_t>(index & 0xFF));

        Hash::Digest512 I = Hash::hmacSha512(chainCode_.data(), chainCode_.size(), data.data(), data.size());

        ChainCode childChainCode;
        std::copy(I.begin() + 32, I.end(), childChainCode.begin());

        // Il must be a valid scalar in [1, n)
        if (!Secp256k1Algorithm::isValidScalar(I.data())) {
            secure_memzero(I.data(), I.size());
            secure_memzero(childChainCode.data(), childChainCode.size());
            SIGIL_LOG_DEBUG(LogCategory::HD) << "invalid child at index " << index;
            throw InvalidChild("The extended key at this index is invalid");
        }

        // Private: (Il + k) mod n, always 32 bytes. Public: Il*G + K, compressed.
        Bytes childKey = key_;
        bool ok = isPrivate_ ? Secp256k1Algorithm::tweakAddPrivate(childKey.data(), I.data())
                             : Secp256k1Algorithm::tweakAddPublic(childKey, I.data());

        // Clean the I entropy
        secure_memzero(I.data(), I.size());

        if (!ok) {
            secure_memzero(childKey.data(), childKey.size());
            secure_memzero(childChainCode.data(), childChainCode.size());
            SIGIL_LOG_DEBUG(LogCategory::HD) << "invalid child at index " << index;
            throw InvalidChild("The extended key at this index is invalid");
        }

        ExtendedKey node(std::move(childKey), childChainCode, HKD::fingerprint(publicKey_),
                         static_cast<uint8_t>(depth_ + 1), index, isPrivate_);
        secure_memzero(childChainCode.data(), childChainCode.size());
        return node;
    }

    ExtendedKey ExtendedKey::hardenedChild(uint32_t n) const {
        return child(n + HKD::HARDENED_OFFSET);
    }

    ExtendedKey ExtendedKey::publicKey() const {
        if (!isPrivate_) {
            return *this;
        }
        return ExtendedKey(publicKey_, chainCode_, parentFP_, depth_, childIndex_, false);
    }

    uint32_t ExtendedKey::parentFingerprint() const {
        return (static_cast<uint32_t>(parentFP_[0]) << 16) |
               (static_cast<uint32_t>(parentFP_[1]) << 8) |
               static_cast<uint32_t>(parentFP_[2]);
    }

    Bytes ExtendedKey::extra() const {
        Bytes out;
        out.reserve(EXTRA_SIZE);
        out.push_back(depth_);
        out.insert(out.end(), parentFP_.begin(), parentFP_.end());
        out.push_back(static_cast<uint8_t>((childIndex_ >> 24) & 0xFF));
        out.push_back(static_cast<uint8_t>((childIndex_ >> 16) & 0xFF));
        out.push_back(static_cast<uint8_t>((childIndex_ >> 8) & 0xFF));
        out.push_back(static_cast<uint8_t>(childIndex_ & 0xFF));
        out.insert(out.end(), chainCode_.begin(), chainCode_.end());
        return out;
    }

    PublicKey ExtendedKey::toPublicKey() const {
        return PublicKey(Secp256k1Algorithm::instance(), publicKey_, extra());
    }

    PrivateKey ExtendedKey::toPrivateKey() const {
        if (!isPrivate_) {
            throw UnsupportedOperation("Unable to create private keys from a public extended key");
        }
        return PrivateKey(Secp256k1Algorithm::instance(), key_, extra());
    }

    std::unique_ptr<Key> ExtendedKey::asSignatureKey() const {
        if (isPrivate_) {
            return std::make_unique<PrivateKey>(toPrivateKey());
        }
        return std::make_unique<PublicKey>(toPublicKey());
    }

    ExtendedKey ExtendedKey::fromSignatureKey(const Key& key) {
        const Algorithm& secp = *Secp256k1Algorithm::instance();
        if (!sameAlgorithm(*key.algorithm(), secp)) {
            throw UnsupportedOperation("ExtendedKey must use the " + secp.name() +
                                       " algorithm; provided key uses " + key.algorithm()->name());
        }

        const Bytes& extra = key.extraBytes();
        if (extra.size() < EXTRA_SIZE) {
            throw InvalidLength("Key carries " + std::to_string(extra.size()) + " extra bytes, need " +
                                std::to_string(EXTRA_SIZE));
        }

        Fingerprint parentFP;
        std::copy(extra.begin() + 1, extra.begin() + 4, parentFP.begin());
        uint32_t childIndex = (static_cast<uint32_t>(extra[4]) << 24) |
                              (static_cast<uint32_t>(extra[5]) << 16) |
                              (static_cast<uint32_t>(extra[6]) << 8) |
                              static_cast<uint32_t>(extra[7]);
        ChainCode chainCode;
        std::copy(extra.begin() + 8, extra.begin() + 40, chainCode.begin());

        ExtendedKey node(key.keyBytes(), chainCode, parentFP, extra[0], childIndex, Sigil::isPrivate(key));
        secure_memzero(chainCode.data(), chainCode.size());
        return node;
    }

    std::string ExtendedKey::toString() const {
        return asSignatureKey()->marshalText();
    }

    ExtendedKey ExtendedKey::fromString(const std::string& text) {
        std::unique_ptr<Key> key = parseKey(text);
        return fromSignatureKey(*key);
    }

    void ExtendedKey::zeroize() {
        secure_clear(key_);
        secure_clear(publicKey_);
        secure_memzero(chainCode_.data(), chainCode_.size());
        secure_memzero(parentFP_.data(), parentFP_.size());
        depth_ = 0;
        childIndex_ = 0;
        isPrivate_ = false;
    }

    bool ExtendedKey::operator==(const ExtendedKey& other) const {
        return isPrivate_ == other.isPrivate_ &&
               depth_ == other.depth_ &&
               childIndex_ == other.childIndex_ &&
               parentFP_ == other.parentFP_ &&
               chainCode_ == other.chainCode_ &&
               key_ == other.key_;
    }

} // namespace Sigil
