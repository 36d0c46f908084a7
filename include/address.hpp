#ifndef ADDRESS_HPP
#define ADDRESS_HPP

#include <cstddef>
#include <string>

#include "exceptions.hpp"
#include "key.hpp"
#include "secure_memory.hpp"

/**
 * @file address.hpp
 * @brief 48-character account addresses derived from public keys.
 */

namespace Sigil {

    /**
     * @class Address
     * @brief A validated address string.
     *
     * Layout before base32: a 2-byte header packing the network prefix and
     * kind letter, the last 26 bytes of SHA-256(data), and a CRC-16 of the
     * preceding 28 bytes. The 30 bytes encode to exactly 48 characters whose
     * first three are the network prefix and the kind.
     */
    class Address {
    public:
        static constexpr char KIND_USER = 'a';
        static constexpr char KIND_NDAU = 'n';
        static constexpr char KIND_ENDOWMENT = 'e';
        static constexpr char KIND_EXCHANGE = 'x';
        static constexpr char KIND_BPC = 'b';
        static constexpr char KIND_MARKET_MAKER = 'm';

        static constexpr size_t LENGTH = 48;
        static constexpr size_t HASH_TRIM = 26;
        static constexpr size_t MIN_DATA_LENGTH = 12;
        static constexpr size_t KIND_OFFSET = 2;

        static const std::string MAIN_NET;
        static const std::string TEST_NET;

        static bool isValidKind(char kind);

        /**
         * @brief Map "user", "u", "ndau", "endowment", "exchange", "bpc",
         * "marketmaker" or any text starting with a kind letter to that kind.
         * @throw ParseFailure If no valid kind results.
         */
        static char parseKind(const std::string& text);

        /**
         * @throw ParseFailure If kind or network is invalid.
         * @throw InvalidLength If data is shorter than MIN_DATA_LENGTH.
         */
        static Address generate(char kind, const Bytes& data, const std::string& network = MAIN_NET);

        /// @brief Address of the raw bytes of a public key.
        static Address generate(char kind, const PublicKey& key, const std::string& network = MAIN_NET);

        /**
         * @brief Check text and return it, lower-cased, as an Address.
         *
         * The network prefix is not checked.
         * @throw InvalidLength If text is not LENGTH characters.
         * @throw ParseFailure If the kind letter is unknown or the text is not base32.
         * @throw BadChecksum If the CRC-16 does not match.
         */
        static Address validate(const std::string& text);

        const std::string& toString() const { return address_; }
        char kind() const { return address_[KIND_OFFSET]; }
        std::string networkPrefix() const { return address_.substr(0, KIND_OFFSET); }

        /// @brief Run validate() again on the stored text.
        void revalidate() const;

        bool operator==(const Address& other) const { return address_ == other.address_; }
        bool operator!=(const Address& other) const { return address_ != other.address_; }

    private:
        explicit Address(std::string address) : address_(std::move(address)) {}

        std::string address_;
    };

} // namespace Sigil

#endif // ADDRESS_HPP
