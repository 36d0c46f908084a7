/**
 * @file test_signature.cpp
 * @brief Unit tests for Sigil::Signature using Catch2.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "../include/ed25519_algorithm.hpp"
#include "../include/key.hpp"
#include "../include/null_algorithm.hpp"
#include "../include/secp256k1_algorithm.hpp"
#include "../include/signature.hpp"

#include <string>

using namespace Sigil;

static Bytes hexToBytes(const std::string& hex) {
    Bytes bytes;
    for (size_t i = 0; i < hex.length(); i += 2) {
        bytes.push_back(static_cast<uint8_t>(strtol(hex.substr(i, 2).c_str(), nullptr, 16)));
    }
    return bytes;
}

static Bytes bytesOf(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

const std::string ED_SEED = "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
const std::string ED_SIG_TEXT = "a4jadtca6xmegagdncyhfeeg6mgia5wctkciq928zdu7u7g2qrsgkiujafkx9qeccyikgq7n22rdu6a69g4gzwu58z2fuy78etuxcskdt37bac83fivh76z7";

TEST_CASE("Signature text form matches the RFC 8032 signature", "[signature]") {
    BufferRandom rng(hexToBytes(ED_SEED));
    auto keys = generate(Ed25519Algorithm::instance(), rng);

    Signature sig = keys.second.sign(Bytes());
    REQUIRE(sig.marshalText() == ED_SIG_TEXT);

    Signature parsed = Signature::parse(ED_SIG_TEXT);
    REQUIRE(parsed == sig);
    REQUIRE(parsed.verify(Bytes(), keys.first));
}

TEST_CASE("Sign and verify scenario", "[signature]") {
    for (const AlgorithmPtr& algorithm : {Ed25519Algorithm::instance(), Secp256k1Algorithm::instance()}) {
        INFO(algorithm->name());
        auto keys = generate(algorithm);
        Bytes msg = bytesOf("pay 10 ndau to ndadprx764ciigti8d8whtw2kct733r85qvjukhqhke3dka4");

        Signature sig = keys.second.sign(msg);
        REQUIRE(keys.first.verify(msg, sig));
        REQUIRE(sig.verify(msg, keys.first));

        Bytes tampered = msg;
        tampered.back() ^= 0x01;
        REQUIRE_FALSE(keys.first.verify(tampered, sig));

        auto other = generate(algorithm);
        REQUIRE_FALSE(other.first.verify(msg, sig));

        // text round trip keeps the signature valid
        Signature again = Signature::parse(sig.marshalText());
        REQUIRE(again == sig);
        REQUIRE(keys.first.verify(msg, again));
    }
}

TEST_CASE("Signatures of one algorithm never verify under another", "[signature]") {
    auto ed = generate(Ed25519Algorithm::instance());
    auto secp = generate(Secp256k1Algorithm::instance());
    Bytes msg = bytesOf("msg");

    REQUIRE_FALSE(secp.first.verify(msg, ed.second.sign(msg)));
    REQUIRE_FALSE(ed.first.verify(msg, secp.second.sign(msg)));
}

TEST_CASE("Signature checks sizes only when the algorithm fixes one", "[signature]") {
    REQUIRE_THROWS_AS(Signature(Ed25519Algorithm::instance(), Bytes(63, 0)), InvalidLength);
    REQUIRE_THROWS_AS(Signature(NullAlgorithm::instance(), Bytes(1, 0)), InvalidLength);

    Signature loose(Secp256k1Algorithm::instance(), Bytes(5, 0));
    REQUIRE(loose.size() == Algorithm::UNBOUNDED_SIZE);

    Signature decoded;
    decoded.unmarshal(loose.marshal());
    REQUIRE(decoded == loose);

    // Ed25519 container holding 3 bytes
    Bytes wire{0x92, 0x01, 0xc4, 0x03, 0x01, 0x02, 0x03};
    REQUIRE_THROWS_AS(decoded.unmarshal(wire), InvalidLength);
}

TEST_CASE("Signature::unmarshalMsg returns the leftovers", "[signature]") {
    auto keys = generate(Secp256k1Algorithm::instance());
    Signature sig = keys.second.sign(bytesOf("msg"));

    Bytes wire = sig.marshal();
    wire.push_back(0xab);
    wire.push_back(0xcd);

    Signature decoded;
    REQUIRE_THROWS_AS(decoded.unmarshal(wire), ParseFailure);

    Bytes leftover = decoded.unmarshalMsg(wire);
    REQUIRE(decoded == sig);
    REQUIRE(leftover == (Bytes{0xab, 0xcd}));
}

TEST_CASE("Signature text decoding rejects corruption", "[signature]") {
    std::string corrupted = ED_SIG_TEXT;
    corrupted[5] = (corrupted[5] == 'a') ? 'b' : 'a';
    REQUIRE_THROWS_AS(Signature::parse(corrupted), BadChecksum);

    std::string badChar = ED_SIG_TEXT;
    badChar[5] = '1';
    REQUIRE_THROWS_AS(Signature::parse(badChar), ParseFailure);
}

TEST_CASE("Null signatures are empty and never verify", "[signature]") {
    Signature null;
    REQUIRE(null.bytes().empty());
    REQUIRE(null.algorithm()->name() == "Null");

    PublicKey nullKey;
    REQUIRE_FALSE(nullKey.verify(Bytes(), null));

    Signature decoded = Signature::parse(null.marshalText());
    REQUIRE(decoded == null);
}
