#ifndef PATH_HPP
#define PATH_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "exceptions.hpp"

/**
 * @file path.hpp
 * @brief Derivation path strings such as "/44'/20036'/100/5".
 */

namespace Sigil {

    /// @brief One "/index" or "/index'" step of a path.
    struct PathElement {
        uint32_t index;
        bool hardened;

        bool operator==(const PathElement& other) const {
            return index == other.index && hardened == other.hardened;
        }
        bool operator!=(const PathElement& other) const { return !(*this == other); }
    };

    /**
     * @class DerivationPath
     * @brief Ordered list of path elements.
     *
     * Grammar, after removing all whitespace: "/" for the root, otherwise
     * (/digits'?)+ where each number fits in 32 bits. A hardened element
     * "n'" derives child n + 2^31.
     */
    class DerivationPath {
    public:
        DerivationPath() = default;
        explicit DerivationPath(std::vector<PathElement> elements) : elements_(std::move(elements)) {}

        /**
         * @throw ParseFailure If text does not match the grammar.
         */
        static DerivationPath parse(const std::string& text);

        const std::vector<PathElement>& elements() const { return elements_; }
        size_t size() const { return elements_.size(); }
        bool empty() const { return elements_.empty(); }

        /**
         * @brief True when candidate is strictly longer and starts with every element of this path.
         */
        bool isParentOf(const DerivationPath& candidate) const;

        /// @brief Canonical text: "/" for the root, else "/n" and "/n'" elements.
        std::string toString() const;

        bool operator==(const DerivationPath& other) const { return elements_ == other.elements_; }
        bool operator!=(const DerivationPath& other) const { return !(*this == other); }

    private:
        std::vector<PathElement> elements_;
    };

} // namespace Sigil

#endif // PATH_HPP
