#ifndef CONTAINER_HPP
#define CONTAINER_HPP

#include <cstddef>
#include <cstdint>

#include "algorithm.hpp"
#include "exceptions.hpp"
#include "secure_memory.hpp"

/**
 * @file container.hpp
 * @brief Binary envelope tagging a payload with its algorithm id.
 */

namespace Sigil {

    /// @brief Algorithm id plus the bytes it qualifies.
    struct IdentifiedData {
        AlgorithmId algorithm = 0;
        Bytes data;
    };

    /**
     * @class Container
     * @brief MessagePack 2-tuple [algorithm id, bin payload].
     *
     * Output is always the most compact encoding: fixarray(2), a positive
     * fixint or uint8 for the id, then bin8, bin16 or bin32. The decoder also
     * accepts the wider array and integer headers MessagePack allows.
     */
    class Container {
    public:
        static Bytes marshal(const IdentifiedData& value);

        /**
         * @brief Decode a buffer that holds exactly one container.
         * @throw ParseFailure If the buffer is malformed or has trailing bytes.
         */
        static IdentifiedData unmarshal(const Bytes& buffer);

        /**
         * @brief Decode the container at the start of buffer.
         * @param consumed Receives the number of bytes read.
         * @throw ParseFailure If the buffer is malformed.
         */
        static IdentifiedData unmarshalPrefix(const uint8_t* buffer, size_t len, size_t& consumed);
    };

} // namespace Sigil

#endif // CONTAINER_HPP
