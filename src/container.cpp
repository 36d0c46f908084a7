#include "../include/container.hpp"

#include <string>

/**
 * @file container.cpp
 * @brief MessagePack subset for the algorithm container.
 */

namespace Sigil {

    namespace {

        class Reader {
        public:
            Reader(const uint8_t* data, size_t len) : data_(data), len_(len), pos_(0) {}

            size_t position() const { return pos_; }

            uint8_t byte() {
                need(1);
                return data_[pos_++];
            }

            uint64_t bigEndian(size_t width) {
                need(width);
                uint64_t value = 0;
                for (size_t i = 0; i < width; ++i) {
                    value = (value << 8) | data_[pos_++];
                }
                return value;
            }

            Bytes take(size_t n) {
                need(n);
                Bytes out(data_ + pos_, data_ + pos_ + n);
                pos_ += n;
                return out;
            }

        private:
            void need(size_t n) const {
                if (len_ - pos_ < n) {
                    throw ParseFailure("Truncated container");
                }
            }

            const uint8_t* data_;
            size_t len_;
            size_t pos_;
        };

        void writeLength(Bytes& out, uint64_t value, size_t width) {
            for (size_t i = width; i > 0; --i) {
                out.push_back(static_cast<uint8_t>(value >> (8 * (i - 1))));
            }
        }

        size_t readArrayHeader(Reader& r) {
            uint8_t tag = r.byte();
            if ((tag & 0xf0) == 0x90) return tag & 0x0f;
            if (tag == 0xdc) return static_cast<size_t>(r.bigEndian(2));
            if (tag == 0xdd) return static_cast<size_t>(r.bigEndian(4));
            throw ParseFailure("Container does not start with an array header");
        }

        AlgorithmId readId(Reader& r) {
            uint8_t tag = r.byte();
            uint64_t value;
            if (tag <= 0x7f) {
                return tag;
            } else if (tag >= 0xcc && tag <= 0xcf) {
                value = r.bigEndian(size_t(1) << (tag - 0xcc));
            } else if (tag >= 0xd0 && tag <= 0xd3) {
                size_t width = size_t(1) << (tag - 0xd0);
                value = r.bigEndian(width);
                // sign bit set
                if (value >> (8 * width - 1)) {
                    throw ParseFailure("Negative algorithm id");
                }
            } else {
                throw ParseFailure("Algorithm id is not an integer");
            }
            if (value > 0xff) {
                throw ParseFailure("Algorithm id " + std::to_string(value) + " does not fit in a byte");
            }
            return static_cast<AlgorithmId>(value);
        }

        Bytes readBin(Reader& r) {
            uint8_t tag = r.byte();
            size_t len;
            switch (tag) {
                case 0xc4: len = static_cast<size_t>(r.bigEndian(1)); break;
                case 0xc5: len = static_cast<size_t>(r.bigEndian(2)); break;
                case 0xc6: len = static_cast<size_t>(r.bigEndian(4)); break;
                default: throw ParseFailure("Container payload is not a bin field");
            }
            return r.take(len);
        }
    }

    Bytes Container::marshal(const IdentifiedData& value) {
        Bytes out;
        out.reserve(value.data.size() + 8);

        out.push_back(0x92);

        if (value.algorithm <= 0x7f) {
            out.push_back(value.algorithm);
        } else {
            out.push_back(0xcc);
            out.push_back(value.algorithm);
        }

        size_t n = value.data.size();
        if (n <= 0xff) {
            out.push_back(0xc4);
            writeLength(out, n, 1);
        } else if (n <= 0xffff) {
            out.push_back(0xc5);
            writeLength(out, n, 2);
        } else {
            out.push_back(0xc6);
            writeLength(out, n, 4);
        }
        out.insert(out.end(), value.data.begin(), value.data.end());

        return out;
    }

    IdentifiedData Container::unmarshalPrefix(const uint8_t* buffer, size_t len, size_t& consumed) {
        Reader r(buffer, len);

        size_t fields = readArrayHeader(r);
        if (fields != 2) {
            throw ParseFailure("Container must hold 2 fields, got " + std::to_string(fields));
        }

        IdentifiedData value;
        value.algorithm = readId(r);
        value.data = readBin(r);

        consumed = r.position();
        return value;
    }

    IdentifiedData Container::unmarshal(const Bytes& buffer) {
        size_t consumed = 0;
        IdentifiedData value = unmarshalPrefix(buffer.data(), buffer.size(), consumed);
        if (consumed != buffer.size()) {
            throw ParseFailure(std::to_string(buffer.size() - consumed) + " leftover bytes after container");
        }
        return value;
    }

} // namespace Sigil
