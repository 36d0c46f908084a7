#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

/**
 * @file exceptions.hpp
 * @brief Exception hierarchy for key, signature, HD and address operations.
 */

namespace Sigil {

    /**
     * @class CryptoException
     * @brief Base class for all Sigil exceptions.
     *
     * This class extends std::runtime_error and serves as the root
     * of the hierarchy. Failures of the underlying crypto backends
     * (OpenSSL, libsecp256k1) that have no more specific kind are
     * reported with this type directly.
     *
     * Catch this type if you want to handle all Sigil errors.
     */
    class CryptoException : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @class InvalidLength
     * @brief Thrown when a seed, key or buffer has the wrong size.
     */
    class InvalidLength : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /**
     * @class UnusableValue
     * @brief Thrown when a derived scalar or point falls outside the valid range.
     *
     * The caller may retry with a different seed.
     */
    class UnusableValue : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /**
     * @class InvalidChild
     * @brief Thrown when the child at a given index cannot be derived.
     *
     * Callers scanning indices should skip to the next index.
     *
     * @note Inherits from UnusableValue.
     */
    class InvalidChild : public UnusableValue
    {
    public:
        using UnusableValue::UnusableValue;
    };

    /**
     * @class BadChecksum
     * @brief Thrown when decoded text fails its checksum.
     */
    class BadChecksum : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /**
     * @class ParseFailure
     * @brief Thrown for malformed paths, prefixes, encodings or containers.
     */
    class ParseFailure : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /**
     * @class UnsupportedOperation
     * @brief Thrown when an operation is not permitted for the value at hand
     * (hardened derivation from a public node, generating Null keys...).
     */
    class UnsupportedOperation : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /**
     * @class UnknownAlgorithm
     * @brief Thrown when an algorithm id or name is absent from the registry.
     */
    class UnknownAlgorithm : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /**
     * @class DepthExceeded
     * @brief Thrown when a derivation would go past depth 255.
     */
    class DepthExceeded : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

    /**
     * @class RegistrationError
     * @brief Thrown when an algorithm cannot be bound to the requested id.
     */
    class RegistrationError : public CryptoException
    {
    public:
        using CryptoException::CryptoException;
    };

} // namespace Sigil

#endif // EXCEPTIONS_HPP
