/**
 * @file test_checksum.cpp
 * @brief Unit tests for Sigil::Checksum using Catch2.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "../include/checksum.hpp"

#include <string>

using namespace Sigil;

static Bytes bytesOf(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

TEST_CASE("Checksum::width pads the framed length to a multiple of 5", "[checksum]") {
    const uint8_t expected[] = {4, 3, 7, 6, 5, 4, 3, 7, 6, 5, 4};
    for (size_t len = 0; len < sizeof(expected); ++len) {
        INFO("input length " << len);
        uint8_t n = Checksum::width(len);
        REQUIRE(n == expected[len]);
        REQUIRE(n >= Checksum::MIN_BYTES);
        REQUIRE((1 + len + n) % Checksum::PAD_WIDTH == 0);
    }
}

TEST_CASE("Checksum::compute takes the tail of SHA-224", "[checksum]") {
    Bytes one = bytesOf("one");
    REQUIRE(Checksum::compute(one.data(), one.size(), Checksum::width(3)) ==
            (Bytes{176, 192, 177, 150, 249, 175}));

    Bytes two = bytesOf("two");
    REQUIRE(Checksum::compute(two.data(), two.size(), 6) == (Bytes{14, 35, 190, 49, 58, 226}));

    Bytes three = bytesOf("three");
    REQUIRE(Checksum::compute(three.data(), three.size(), Checksum::width(5)) ==
            (Bytes{166, 243, 135, 67}));

    Bytes four = bytesOf("four");
    REQUIRE(Checksum::compute(four.data(), four.size(), Checksum::width(4)) ==
            (Bytes{4, 149, 35, 186, 113}));

    Bytes five = bytesOf("five");
    REQUIRE(Checksum::compute(five.data(), five.size(), 5) == (Bytes{88, 10, 161, 100, 95}));
}

TEST_CASE("Checksum::check accepts what add produced", "[checksum]") {
    for (const char* msg : {"", "fox", "socks", "box", "knox", "a somewhat longer message"}) {
        Bytes payload = bytesOf(msg);
        Bytes framed = Checksum::add(payload);
        REQUIRE(framed.size() % Checksum::PAD_WIDTH == 0);
        REQUIRE(framed[0] == Checksum::width(payload.size()));

        Bytes out;
        REQUIRE(Checksum::check(framed, out));
        REQUIRE(out == payload);
    }
}

TEST_CASE("Checksum::check detects every single bit flip", "[checksum]") {
    Bytes framed = Checksum::add(bytesOf("the quick brown fox"));
    for (size_t i = 0; i < framed.size(); ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            Bytes corrupted = framed;
            corrupted[i] ^= static_cast<uint8_t>(1 << bit);
            Bytes out;
            INFO("byte " << i << " bit " << bit);
            REQUIRE_FALSE(Checksum::check(corrupted, out));
        }
    }
}

TEST_CASE("Checksum::check rejects malformed frames", "[checksum]") {
    Bytes out;
    REQUIRE_FALSE(Checksum::check(Bytes(), out));
    REQUIRE_FALSE(Checksum::check(Bytes{3, 0, 0}, out));
    // width byte below the minimum
    REQUIRE_FALSE(Checksum::check(Bytes{2, 0, 0, 0, 0}, out));
    // width byte larger than the buffer
    REQUIRE_FALSE(Checksum::check(Bytes{200, 0, 0, 0, 0}, out));
}
