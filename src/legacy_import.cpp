#include "../include/hkd.hpp"
#include "../include/b32.hpp"
#include "../include/hash.hpp"
#include "../include/secp256k1_algorithm.hpp"

#include <algorithm>

/**
 * @file legacy_import.cpp
 * @brief Import of extended keys written before the key container existed.
 */

namespace Sigil {

    namespace {
        // version(3) depth(1) fingerprint(3) index(4) chain code(32) key(33)
        constexpr size_t LEGACY_PAYLOAD_SIZE = 3 + 1 + 3 + 4 + 32 + 33;
        constexpr size_t LEGACY_CHECKSUM_SIZE = 4;
    }

    ExtendedKey ExtendedKey::fromLegacySerialization(const std::string& text) {
        Bytes decoded = B32::decode(text);
        if (decoded.size() != LEGACY_PAYLOAD_SIZE + LEGACY_CHECKSUM_SIZE) {
            secure_memzero(decoded.data(), decoded.size());
            throw InvalidLength("The serialized extended key length is invalid: " +
                                std::to_string(decoded.size()) + " bytes");
        }

        Hash::Digest256 expected = Hash::doubleSha256(decoded.data(), LEGACY_PAYLOAD_SIZE);
        if (!constant_time_equal(expected.data(), decoded.data() + LEGACY_PAYLOAD_SIZE, LEGACY_CHECKSUM_SIZE)) {
            secure_memzero(decoded.data(), decoded.size());
            throw BadChecksum("Bad extended key checksum");
        }

        // the version bytes at [0, 3) are not interpreted
        uint8_t depth = decoded[3];
        Fingerprint parentFP;
        std::copy(decoded.begin() + 4, decoded.begin() + 7, parentFP.begin());
        uint32_t childIndex = (static_cast<uint32_t>(decoded[7]) << 24) |
                              (static_cast<uint32_t>(decoded[8]) << 16) |
                              (static_cast<uint32_t>(decoded[9]) << 8) |
                              static_cast<uint32_t>(decoded[10]);
        ChainCode chainCode;
        std::copy(decoded.begin() + 11, decoded.begin() + 43, chainCode.begin());

        const uint8_t* keyData = decoded.data() + 43;
        bool isPrivate = keyData[0] == 0x00;

        Bytes key;
        if (isPrivate) {
            key.assign(keyData + 1, keyData + 33);
            if (!Secp256k1Algorithm::isValidScalar(key.data())) {
                secure_memzero(key.data(), key.size());
                secure_memzero(decoded.data(), decoded.size());
                throw UnusableValue("Legacy extended key holds an out-of-range private scalar");
            }
        } else {
            if (!Secp256k1Algorithm::isValidPublicKey(keyData, 33)) {
                throw ParseFailure("Legacy extended key holds an invalid public point");
            }
            key.assign(keyData, keyData + 33);
        }
        secure_memzero(decoded.data(), decoded.size());

        ExtendedKey node(std::move(key), chainCode, parentFP, depth, childIndex, isPrivate);
        secure_memzero(chainCode.data(), chainCode.size());
        return node;
    }

} // namespace Sigil
