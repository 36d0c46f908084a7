#include "../include/secp256k1_algorithm.hpp"
#include "../include/hash.hpp"
#include "../include/hkd.hpp"
#include "../include/seed.hpp"

#include <secp256k1.h>

#include <string>

/**
 * @file secp256k1_algorithm.cpp
 * @brief Implementation of secp256k1 signing and the curve helpers.
 */

namespace Sigil {

    namespace {

        const secp256k1_context* context() {
            static secp256k1_context* ctx =
                secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
            return ctx;
        }

        Bytes serializeCompressed(const secp256k1_pubkey& pubkey) {
            Bytes output(Secp256k1Algorithm::PUBLIC_KEY_SIZE);
            size_t outputLen = output.size();
            secp256k1_ec_pubkey_serialize(context(), output.data(), &outputLen, &pubkey,
                                          SECP256K1_EC_COMPRESSED);
            return output;
        }
    }

    AlgorithmPtr Secp256k1Algorithm::instance() {
        static const AlgorithmPtr algorithm = std::make_shared<Secp256k1Algorithm>();
        return algorithm;
    }

    KeyPair Secp256k1Algorithm::generate(RandomSource& rng) const {
        SecureBytes seed = Seed::generate(Seed::RECOMMENDED_BYTES, rng);
        HKD::NodeSecret master = HKD::computeMasterSecret(seed.data(), seed.size());

        KeyPair pair;
        pair.privateKey.assign(master.key.begin(), master.key.end());
        master.zeroize();
        pair.publicKey = publicFromPrivate(pair.privateKey.data());

        return pair;
    }

    Bytes Secp256k1Algorithm::sign(const Bytes& privateKey, const Bytes& message) const {
        if (privateKey.size() != static_cast<size_t>(PRIVATE_KEY_SIZE)) {
            throw InvalidLength("secp256k1 private key must be " + std::to_string(PRIVATE_KEY_SIZE) +
                                " bytes, got " + std::to_string(privateKey.size()));
        }

        Hash::Digest256 digest = Hash::sha256(message);

        secp256k1_ecdsa_signature sig;
        if (!secp256k1_ecdsa_sign(context(), &sig, digest.data(), privateKey.data(), nullptr, nullptr)) {
            throw UnusableValue("Invalid secp256k1 private key");
        }

        // 72 bytes is the DER upper bound
        Bytes der(72);
        size_t derLen = der.size();
        if (!secp256k1_ecdsa_signature_serialize_der(context(), der.data(), &derLen, &sig)) {
            throw CryptoException("Failure to serialize the signature");
        }
        der.resize(derLen);

        return der;
    }

    bool Secp256k1Algorithm::verify(const Bytes& publicKey, const Bytes& message, const Bytes& signature) const {
        secp256k1_pubkey pubkey;
        if (publicKey.empty() ||
            !secp256k1_ec_pubkey_parse(context(), &pubkey, publicKey.data(), publicKey.size())) {
            return false;
        }

        secp256k1_ecdsa_signature sig;
        if (signature.empty() ||
            !secp256k1_ecdsa_signature_parse_der(context(), &sig, signature.data(), signature.size())) {
            return false;
        }

        // libsecp256k1 only accepts lower-S signatures
        secp256k1_ecdsa_signature_normalize(context(), &sig, &sig);

        Hash::Digest256 digest = Hash::sha256(message);
        return secp256k1_ecdsa_verify(context(), &sig, digest.data(), &pubkey) == 1;
    }

    Bytes Secp256k1Algorithm::derivePublic(const Bytes& privateKey) const {
        if (privateKey.size() != static_cast<size_t>(PRIVATE_KEY_SIZE)) {
            throw InvalidLength("secp256k1 private key must be " + std::to_string(PRIVATE_KEY_SIZE) +
                                " bytes, got " + std::to_string(privateKey.size()));
        }
        return publicFromPrivate(privateKey.data());
    }

    bool Secp256k1Algorithm::isValidScalar(const uint8_t* scalar) {
        return secp256k1_ec_seckey_verify(context(), scalar) == 1;
    }

    bool Secp256k1Algorithm::isValidPublicKey(const uint8_t* point, size_t len) {
        if (len == 0) return false;
        secp256k1_pubkey pubkey;
        return secp256k1_ec_pubkey_parse(context(), &pubkey, point, len) == 1;
    }

    Bytes Secp256k1Algorithm::publicFromPrivate(const uint8_t* scalar) {
        if (!isValidScalar(scalar)) {
            throw UnusableValue("Invalid private key");
        }

        secp256k1_pubkey pubkey;
        if (!secp256k1_ec_pubkey_create(context(), &pubkey, scalar)) {
            throw CryptoException("Failure to create the public key");
        }

        return serializeCompressed(pubkey);
    }

    bool Secp256k1Algorithm::tweakAddPrivate(uint8_t* scalar, const uint8_t* tweak) {
        return secp256k1_ec_seckey_tweak_add(context(), scalar, tweak) == 1;
    }

    bool Secp256k1Algorithm::tweakAddPublic(Bytes& point, const uint8_t* tweak) {
        secp256k1_pubkey pubkey;
        if (point.empty() || !secp256k1_ec_pubkey_parse(context(), &pubkey, point.data(), point.size())) {
            return false;
        }
        if (!secp256k1_ec_pubkey_tweak_add(context(), &pubkey, tweak)) {
            return false;
        }
        point = serializeCompressed(pubkey);
        return true;
    }

} // namespace Sigil
