/**
 * @file test_path.cpp
 * @brief Unit tests for Sigil::DerivationPath and ExtendedKey::deriveFrom using Catch2.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "../include/hkd.hpp"
#include "../include/path.hpp"

#include <string>

using namespace Sigil;

static ExtendedKey master() {
    std::string seed = "abcdefghijklmnopqrstuvwxyz123456";
    return ExtendedKey::newMaster(Bytes(seed.begin(), seed.end()));
}

const std::string ACCOUNT_TEXT = "npvta8jaftcjebidf43dadtutad7q5d5s5d68s2e3dxm7qacg5grxxdksth3k57jqbartgzaaaaaaysfpvwxb8amasuywgs9i7ctvztvsvfkxeddf35st3a48h2zq2iupmk8ysndyrnm";
const std::string ACCOUNT_PUB_TEXT = "npuba4jaftckeeb4zufh8cn9f8f6cz6cve966efjz8hfnfyrsp9pr77w3qshtzrdabseb8e46aaaaac4axyquwh2bncck4s4d7dwkgq8gqcnxkwsnnzhqchedm29c75bcjuuk49252qj";

TEST_CASE("DerivationPath::parse accepts well-formed paths", "[path]") {
    REQUIRE(DerivationPath::parse("/").empty());
    REQUIRE(DerivationPath::parse(" / ").empty());

    DerivationPath p = DerivationPath::parse("/44'/20036'/100/5");
    REQUIRE(p.size() == 4);
    REQUIRE(p.elements()[0] == (PathElement{44, true}));
    REQUIRE(p.elements()[1] == (PathElement{20036, true}));
    REQUIRE(p.elements()[2] == (PathElement{100, false}));
    REQUIRE(p.elements()[3] == (PathElement{5, false}));

    REQUIRE(DerivationPath::parse(" /1 / 2' ") == DerivationPath::parse("/1/2'"));
    REQUIRE(DerivationPath::parse("/4294967295").elements()[0].index == 4294967295u);
    REQUIRE(DerivationPath::parse("/007").elements()[0].index == 7);
}

TEST_CASE("DerivationPath::parse rejects malformed paths", "[path]") {
    for (const char* bad : {"", "1/2", "//1", "/1/", "/a", "/1''", "/'", "m/0", "/1h", "/-1",
                            "/4294967296", "/99999999999999999999", "/1/2/x"}) {
        INFO("path \"" << bad << "\"");
        REQUIRE_THROWS_AS(DerivationPath::parse(bad), ParseFailure);
    }
}

TEST_CASE("DerivationPath::toString renders the canonical form", "[path]") {
    REQUIRE(DerivationPath::parse("/").toString() == "/");
    REQUIRE(DerivationPath::parse(" /44' / 20036'/0010 ").toString() == "/44'/20036'/10");
}

TEST_CASE("DerivationPath::isParentOf", "[path]") {
    DerivationPath root = DerivationPath::parse("/");
    DerivationPath a = DerivationPath::parse("/44'");
    DerivationPath ab = DerivationPath::parse("/44'/1");
    DerivationPath unhardened = DerivationPath::parse("/44/1");

    REQUIRE(root.isParentOf(a));
    REQUIRE(root.isParentOf(ab));
    REQUIRE(a.isParentOf(ab));
    REQUIRE_FALSE(ab.isParentOf(a));
    REQUIRE_FALSE(a.isParentOf(a));
    REQUIRE_FALSE(root.isParentOf(root));
    REQUIRE_FALSE(a.isParentOf(unhardened));
}

TEST_CASE("ExtendedKey::deriveFrom walks the path", "[deriveFrom]") {
    ExtendedKey m = master();

    ExtendedKey account = m.deriveFrom("/", "/44'/20036'/100/5");
    REQUIRE(account.toString() == ACCOUNT_TEXT);
    REQUIRE(account.publicKey().toString() == ACCOUNT_PUB_TEXT);
    REQUIRE(account.depth() == 4);
    REQUIRE(account.childIndex() == 5);

    REQUIRE(account == m.hardenedChild(44).hardenedChild(20036).child(100).child(5));
}

TEST_CASE("ExtendedKey::deriveFrom is associative", "[deriveFrom]") {
    ExtendedKey m = master();

    ExtendedKey direct = m.deriveFrom("/", "/44'/20036'/100/5");
    ExtendedKey mid = m.deriveFrom("/", "/44'/20036'");
    ExtendedKey stepwise = mid.deriveFrom("/44'/20036'", "/44'/20036'/100/5");
    REQUIRE(stepwise == direct);

    // public derivation below the hardened prefix reaches the same public node
    ExtendedKey pubMid = mid.publicKey();
    REQUIRE(pubMid.deriveFrom("/44'/20036'", "/44'/20036'/100/5") == direct.publicKey());
}

TEST_CASE("ExtendedKey::deriveFrom accepts an equal path", "[deriveFrom]") {
    ExtendedKey m = master();
    REQUIRE(m.deriveFrom("/", "/") == m);
    REQUIRE(m.deriveFrom("/1/2", "/1/2") == m);
}

TEST_CASE("ExtendedKey::deriveFrom errors", "[deriveFrom]") {
    ExtendedKey m = master();

    REQUIRE_THROWS_AS(m.deriveFrom("/1", "/2/3"), ParseFailure);
    REQUIRE_THROWS_AS(m.deriveFrom("/1/2", "/1"), ParseFailure);
    REQUIRE_THROWS_AS(m.deriveFrom("/", "/x"), ParseFailure);
    REQUIRE_THROWS_AS(m.deriveFrom("bad", "/1"), ParseFailure);

    REQUIRE_THROWS_AS(m.publicKey().deriveFrom("/", "/1/2'"), UnsupportedOperation);

    // the receiver is untouched by failures
    REQUIRE(m == master());
}
