/**
 * @file test_hkd.cpp
 * @brief Unit tests for Sigil::HKD and Sigil::ExtendedKey using Catch2.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "../include/ed25519_algorithm.hpp"
#include "../include/hkd.hpp"
#include "../include/secp256k1_algorithm.hpp"
#include "../include/signature.hpp"

#include <iomanip>
#include <sstream>
#include <vector>

using namespace Sigil;

// --- Helper Functions ---

/**
 * @brief Convert a byte container to hex string for validation.
 */
template <typename Container>
static std::string toHex(const Container& data) {
    std::ostringstream oss;
    for (auto b : data) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

static Bytes bytesOf(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

// --- Test Data: seed "abcdefghijklmnopqrstuvwxyz123456" ---
const std::string SEED = "abcdefghijklmnopqrstuvwxyz123456";
const std::string M_PRV = "3cf24cd1f033e3cd8008343c88f689f4921ac1fb66800da4cbe1c10dfb0c6c75";
const std::string M_CC  = "625dbe0d48d53d7ed99a908b1d305997e97b67e8a778391498216565e3b0967e";
const std::string M_PUB = "031b09067653155f3d78afb3b29ce5282285446fc8a2f98480e42d222c2ce3ae47";

const std::string M_TEXT  = "npvta8jaftcjea8revgt8a38hvnaba4d3chyth4jegyb9pviadpe3rs6cdr5btyhkaaaaaaaaaaaabtf5rspjdkv49y3vkiiyhjsmgm8u85h7cvzsqiwvasyk3rdycmh6hm7nd8ezxvt";
const std::string MP_TEXT = "npuba4jaftckeebtycigq3jtkz37rcz5hnw66wwcfbkep9ekf8nesduc4itnfvt46t2aaaaaaaaaaaagezp8bxepkrm85gpjbc27gbn3r4m5n9wkq8b3cuncc3mf6q2jn9wfy8gicni6";
const std::string C0_TEXT = "npvta8jaftcjebftp47w28ff4fubj2gz8tvv2pe8w3swctdzuft7umrhddngsy8h8ai9vw2aaaaaabnd94e9faf9abdf4rsw9jf6rej7fr74s4s6i4r37x5fucu6kz9xm8kazkw6grwm";
const std::string C0_KEY  = "4b16ebb4c78a5d16414e0d7f4673c349ea6614144779163d92de718d8685bc7f";
const std::string C0P_TEXT = "npuba4jaftckeebaixapk6z2wb2jp9ssb5mfsekybs5y46crgdi8j556vdibbjkg28sbd8qvaaaaaaafsr9iv6waz6aenzj8cv7ezt6thwx9zkdkdtdj9hyznyikmtk98xpyeseypuhv";
const std::string H0_KEY  = "57f269c663a728635d21c848a97252cca6a9f130f72faf74ebd3567a4033c3a9";

// Child 15 of this master has a scalar with a leading zero byte
const std::string C15_KEY = "002ad760ce1880e66174e639e9396d96af4a0ef2d443402111dafd9452d9fe38";

// --- Test Data: seed bytes 0x00..0x0f ---
const std::string SHORT_S_TEXT = "npvta8jaftcjebc56pvxgs8w2448fibvc4yqeub8b49b7k4tdg7t5dsdhayzi569eaaaaaaaaaaaadmt69zefwr5pfdk99mg23ufiu58nazicguu9g6r58xeqwguxxachhw8sfiuejtf";
const std::string SHORT_P_TEXT = "npuba4jaftckeebzgm7usrcx9jxve8rhst5uejqqtzdtjvhdeswdyzvhn22k98kq25iaaaaaaaaaaaapqhv86syt9pwwpm97n5dgixcmr3sc7ai4km65t9r4wt4s4kywai6fkiae5jkc";

static ExtendedKey master() {
    return ExtendedKey::newMaster(bytesOf(SEED));
}

// --- Test Cases ---

TEST_CASE("HKD::computeMasterSecret splits HMAC-SHA512 under \"ndau seed\"", "[computeMasterSecret]") {
    Bytes seed = bytesOf(SEED);
    HKD::NodeSecret secret = HKD::computeMasterSecret(seed.data(), seed.size());

    REQUIRE(toHex(secret.key) == M_PRV);
    REQUIRE(toHex(secret.chainCode) == M_CC);

    secret.zeroize();
    REQUIRE(toHex(secret.key) == std::string(64, '0'));
}

TEST_CASE("HKD::computeMasterSecret checks the seed length", "[computeMasterSecret]") {
    Bytes tooShort(15, 1);
    Bytes tooLong(65, 1);
    Bytes shortest(16, 1);
    Bytes longest(64, 1);

    REQUIRE_THROWS_AS(HKD::computeMasterSecret(tooShort.data(), tooShort.size()), InvalidLength);
    REQUIRE_THROWS_AS(HKD::computeMasterSecret(tooLong.data(), tooLong.size()), InvalidLength);
    REQUIRE_NOTHROW(HKD::computeMasterSecret(shortest.data(), shortest.size()));
    REQUIRE_NOTHROW(HKD::computeMasterSecret(longest.data(), longest.size()));
}

TEST_CASE("HKD index helpers", "[hkd]") {
    REQUIRE_FALSE(HKD::isHardened(0));
    REQUIRE_FALSE(HKD::isHardened(0x7fffffff));
    REQUIRE(HKD::isHardened(0x80000000));
    REQUIRE(HKD::hardenIndex(44) == 0x8000002c);
}

TEST_CASE("ExtendedKey::newMaster builds the root node", "[newMaster]") {
    ExtendedKey m = master();

    REQUIRE(m.isPrivate());
    REQUIRE(m.depth() == 0);
    REQUIRE(m.parentFingerprint() == 0);
    REQUIRE(m.childIndex() == 0);
    REQUIRE(toHex(m.keyBytes()) == M_PRV);
    REQUIRE(toHex(m.chainCode()) == M_CC);
    REQUIRE(toHex(m.publicKeyBytes()) == M_PUB);

    REQUIRE(m.toString() == M_TEXT);
    REQUIRE(m.toString().size() == 140);
    REQUIRE(m.publicKey().toString() == MP_TEXT);
}

TEST_CASE("ExtendedKey::newMaster on a 16-byte seed", "[newMaster]") {
    Bytes seed;
    for (uint8_t i = 0; i < 16; ++i) seed.push_back(i);

    ExtendedKey m = ExtendedKey::newMaster(seed);
    REQUIRE(m.toString() == SHORT_S_TEXT);
    REQUIRE(m.publicKey().toString() == SHORT_P_TEXT);
    REQUIRE(toHex(m.keyBytes()) == "45be3675343d4c6b5e2a03316ace2483e0ebe1eab5119bb1d8e03382d746f9f2");
    REQUIRE(toHex(m.publicKeyBytes()) == "03732fb283c55fa6b3279e784772225ce8dc714cce324283b5e676630aff94ec6d");
}

TEST_CASE("ExtendedKey text round trip signs and verifies", "[newMaster][signature]") {
    ExtendedKey s = ExtendedKey::fromString(SHORT_S_TEXT);
    ExtendedKey p = ExtendedKey::fromString(SHORT_P_TEXT);
    REQUIRE(s.isPrivate());
    REQUIRE_FALSE(p.isPrivate());

    Bytes msg = bytesOf("a message to be signed by the master key");
    Signature sig = s.toPrivateKey().sign(msg);
    PublicKey pub = p.toPublicKey();
    REQUIRE(pub.verify(msg, sig));

    Bytes tampered = msg;
    tampered[0] ^= 0x01;
    REQUIRE_FALSE(pub.verify(tampered, sig));
}

TEST_CASE("ExtendedKey normal and hardened children differ", "[child]") {
    ExtendedKey m = master();
    for (uint32_t n : {0u, 1u, 2u, 44u, 1000u}) {
        ExtendedKey normal = m.child(n);
        ExtendedKey hardened = m.hardenedChild(n);
        REQUIRE(normal != hardened);
        REQUIRE(normal.keyBytes() != hardened.keyBytes());
    }
}

TEST_CASE("ExtendedKey::child matches pinned vectors", "[child]") {
    ExtendedKey m = master();
    ExtendedKey c0 = m.child(0);

    REQUIRE(c0.isPrivate());
    REQUIRE(c0.depth() == 1);
    REQUIRE(c0.childIndex() == 0);
    REQUIRE(c0.parentFingerprint() != 0);
    REQUIRE(toHex(c0.keyBytes()) == C0_KEY);
    REQUIRE(c0.toString() == C0_TEXT);

    ExtendedKey h0 = m.hardenedChild(0);
    REQUIRE(h0.childIndex() == HKD::HARDENED_OFFSET);
    REQUIRE(toHex(h0.keyBytes()) == H0_KEY);
    REQUIRE(m.child(HKD::hardenIndex(0)) == h0);

    // the parent is untouched
    REQUIRE(m.toString() == M_TEXT);
}

TEST_CASE("ExtendedKey derivation commutes with publicKey", "[child][public]") {
    ExtendedKey m = master();

    ExtendedKey viaPrivate = m.child(0).publicKey();
    ExtendedKey viaPublic = m.publicKey().child(0);

    REQUIRE(viaPrivate == viaPublic);
    REQUIRE(viaPrivate.toString() == C0P_TEXT);
    REQUIRE(viaPublic.toString() == C0P_TEXT);

    for (uint32_t i : {1u, 7u, 1000u, 0x7fffffffu}) {
        INFO("index " << i);
        REQUIRE(m.child(i).publicKey() == m.publicKey().child(i));
    }
}

TEST_CASE("ExtendedKey::child keeps leading zero bytes of the scalar", "[child][edge_case]") {
    ExtendedKey c15 = master().child(15);
    REQUIRE(c15.keyBytes().size() == 32);
    REQUIRE(toHex(c15.keyBytes()) == C15_KEY);

    // survives export and import
    ExtendedKey again = ExtendedKey::fromString(c15.toString());
    REQUIRE(again == c15);
    REQUIRE(toHex(again.keyBytes()) == C15_KEY);
}

TEST_CASE("ExtendedKey::child refuses hardened derivation from a public node", "[child]") {
    ExtendedKey pub = master().publicKey();
    REQUIRE_FALSE(pub.isPrivate());
    REQUIRE_THROWS_AS(pub.hardenedChild(0), UnsupportedOperation);
    REQUIRE_THROWS_AS(pub.child(HKD::HARDENED_OFFSET + 5), UnsupportedOperation);
}

TEST_CASE("ExtendedKey::child stops at depth 255", "[child]") {
    ExtendedKey deep(Bytes(master().keyBytes()), master().chainCode(), ExtendedKey::Fingerprint{{1, 2, 3}},
                     254, 9, true);
    ExtendedKey last = deep.child(1);
    REQUIRE(last.depth() == 255);
    REQUIRE_THROWS_AS(last.child(1), DepthExceeded);
    REQUIRE_THROWS_AS(last.publicKey().child(1), DepthExceeded);
}

TEST_CASE("ExtendedKey::publicKey is idempotent", "[public]") {
    ExtendedKey pub = master().publicKey();
    REQUIRE(pub.publicKey() == pub);
    REQUIRE(pub.keyBytes() == pub.publicKeyBytes());
    REQUIRE(toHex(pub.keyBytes()) == M_PUB);
}

TEST_CASE("ExtendedKey exports to keys carrying the HD metadata", "[export]") {
    ExtendedKey c0 = master().child(0);

    PrivateKey pvt = c0.toPrivateKey();
    REQUIRE(pvt.algorithm()->name() == "Secp256k1");
    REQUIRE(pvt.extraBytes().size() == ExtendedKey::EXTRA_SIZE);
    REQUIRE(pvt.extraBytes()[0] == 1);
    REQUIRE(toHex(Bytes(pvt.extraBytes().begin() + 8, pvt.extraBytes().end())) == toHex(c0.chainCode()));

    PublicKey pub = c0.toPublicKey();
    REQUIRE(pub.keyBytes() == c0.publicKeyBytes());
    REQUIRE(pub.extraBytes() == pvt.extraBytes());

    // keys exported from the tree still sign and verify
    Bytes msg = bytesOf("hd message");
    REQUIRE(pub.verify(msg, pvt.sign(msg)));
    REQUIRE(keysMatch(pub, pvt));

    REQUIRE_THROWS_AS(c0.publicKey().toPrivateKey(), UnsupportedOperation);

    std::unique_ptr<Key> asKey = c0.asSignatureKey();
    REQUIRE(isPrivate(*asKey));
    REQUIRE(isPublic(*c0.publicKey().asSignatureKey()));
}

TEST_CASE("ExtendedKey::fromSignatureKey and fromString", "[import]") {
    ExtendedKey c0 = master().child(0);

    REQUIRE(ExtendedKey::fromSignatureKey(c0.toPrivateKey()) == c0);
    REQUIRE(ExtendedKey::fromSignatureKey(c0.toPublicKey()) == c0.publicKey());
    REQUIRE(ExtendedKey::fromString(C0_TEXT) == c0);
    REQUIRE(ExtendedKey::fromString(C0P_TEXT) == c0.publicKey());

    auto ed = generate(Ed25519Algorithm::instance());
    REQUIRE_THROWS_AS(ExtendedKey::fromSignatureKey(ed.first), UnsupportedOperation);

    PrivateKey bare(Secp256k1Algorithm::instance(), c0.keyBytes(), Bytes(39, 0));
    REQUIRE_THROWS_AS(ExtendedKey::fromSignatureKey(bare), InvalidLength);

    REQUIRE_THROWS_AS(ExtendedKey::fromString("garbage"), ParseFailure);
}

TEST_CASE("ExtendedKey constructor validates key material", "[hkd]") {
    ExtendedKey::ChainCode cc{};
    ExtendedKey::Fingerprint fp{};

    REQUIRE_THROWS_AS(ExtendedKey(Bytes(31, 1), cc, fp, 0, 0, true), InvalidLength);
    REQUIRE_THROWS_AS(ExtendedKey(Bytes(32, 1), cc, fp, 0, 0, false), InvalidLength);
    REQUIRE_THROWS_AS(ExtendedKey(Bytes(32, 0), cc, fp, 0, 0, true), UnusableValue);
}

TEST_CASE("ExtendedKey::zeroize scrubs the node", "[hkd]") {
    ExtendedKey m = master();
    m.zeroize();

    REQUIRE_FALSE(m.isPrivate());
    REQUIRE(m.keyBytes().empty());
    REQUIRE(m.publicKeyBytes().empty());
    REQUIRE(toHex(m.chainCode()) == std::string(64, '0'));
    REQUIRE(m.depth() == 0);
}
