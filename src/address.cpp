#include "../include/address.hpp"
#include "../include/b32.hpp"
#include "../include/hash.hpp"
#include "../include/logging.hpp"

#include <algorithm>
#include <cctype>

/**
 * @file address.cpp
 * @brief Address generation and validation.
 */

namespace Sigil {

    const std::string Address::MAIN_NET = "nd";
    const std::string Address::TEST_NET = "tn";

    namespace {

        std::string toLower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }
    }

    bool Address::isValidKind(char kind) {
        switch (kind) {
            case KIND_USER:
            case KIND_NDAU:
            case KIND_ENDOWMENT:
            case KIND_EXCHANGE:
            case KIND_BPC:
            case KIND_MARKET_MAKER:
                return true;
            default:
                return false;
        }
    }

    char Address::parseKind(const std::string& text) {
        if (text.empty()) {
            throw ParseFailure("Empty string is not a valid kind");
        }

        std::string v = toLower(text);
        char kind;
        if (v == "u" || v == "user") kind = KIND_USER;
        else if (v == "ndau") kind = KIND_NDAU;
        else if (v == "endowment") kind = KIND_ENDOWMENT;
        else if (v == "exchange") kind = KIND_EXCHANGE;
        else if (v == "bpc") kind = KIND_BPC;
        else if (v == "marketmaker") kind = KIND_MARKET_MAKER;
        else kind = v[0];

        if (!isValidKind(kind)) {
            throw ParseFailure("\"" + text + "\" is not a valid kind");
        }
        return kind;
    }

    Address Address::generate(char kind, const Bytes& data, const std::string& network) {
        if (!isValidKind(kind)) {
            throw ParseFailure(std::string("Invalid address kind: ") + kind);
        }
        if (network.size() != KIND_OFFSET || B32::index(network[0]) < 0 || B32::index(network[1]) < 0) {
            throw ParseFailure("Invalid network prefix: \"" + network + "\"");
        }
        if (data.size() < MIN_DATA_LENGTH) {
            throw InvalidLength("Insufficient quantity of data: " + std::to_string(data.size()) + " bytes");
        }

        Hash::Digest256 h = Hash::sha256(data);

        unsigned header = (static_cast<unsigned>(B32::index(network[0])) << 11) |
                          (static_cast<unsigned>(B32::index(network[1])) << 6) |
                          (static_cast<unsigned>(B32::index(kind)) << 1);

        Bytes raw;
        raw.reserve(2 + HASH_TRIM + 2);
        raw.push_back(static_cast<uint8_t>((header >> 8) & 0xFF));
        raw.push_back(static_cast<uint8_t>(header & 0xFF));
        raw.insert(raw.end(), h.end() - HASH_TRIM, h.end());

        std::array<uint8_t, 2> crc = B32::checksum16(raw);
        raw.insert(raw.end(), crc.begin(), crc.end());

        return Address(B32::encode(raw));
    }

    Address Address::generate(char kind, const PublicKey& key, const std::string& network) {
        return generate(kind, key.keyBytes(), network);
    }

    Address Address::validate(const std::string& text) {
        std::string addr = toLower(text);
        if (addr.size() != LENGTH) {
            throw InvalidLength("Not a valid address length: " + std::to_string(addr.size()));
        }
        if (!isValidKind(addr[KIND_OFFSET])) {
            throw ParseFailure(std::string("Unknown address kind: ") + addr[KIND_OFFSET]);
        }

        Bytes raw = B32::decode(addr);
        if (raw.size() < 2 || !B32::check16(raw.data(), raw.size() - 2, raw.data() + raw.size() - 2)) {
            SIGIL_LOG_DEBUG(LogCategory::ADDRESS) << "checksum failure for " << addr;
            throw BadChecksum("Address checksum failure");
        }

        return Address(addr);
    }

    void Address::revalidate() const {
        validate(address_);
    }

} // namespace Sigil
