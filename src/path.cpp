#include "../include/path.hpp"
#include "../include/hkd.hpp"

#include <cctype>

/**
 * @file path.cpp
 * @brief Path parsing and ExtendedKey::deriveFrom.
 */

namespace Sigil {

    DerivationPath DerivationPath::parse(const std::string& text) {
        std::string s;
        s.reserve(text.size());
        for (char c : text) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                s.push_back(c);
            }
        }

        if (s == "/") {
            return DerivationPath();
        }
        if (s.empty()) {
            throw ParseFailure("Not a valid path string: empty");
        }

        std::vector<PathElement> elements;
        size_t pos = 0;
        while (pos < s.size()) {
            if (s[pos] != '/') {
                throw ParseFailure("Not a valid path string: " + text);
            }
            ++pos;

            size_t start = pos;
            uint64_t value = 0;
            while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
                value = value * 10 + static_cast<uint64_t>(s[pos] - '0');
                if (value > 0xFFFFFFFFULL) {
                    throw ParseFailure("Path index out of range: " + text);
                }
                ++pos;
            }
            if (pos == start) {
                throw ParseFailure("Not a valid path string: " + text);
            }

            bool hardened = false;
            if (pos < s.size() && s[pos] == '\'') {
                hardened = true;
                ++pos;
            }

            elements.push_back(PathElement{static_cast<uint32_t>(value), hardened});
        }

        return DerivationPath(std::move(elements));
    }

    bool DerivationPath::isParentOf(const DerivationPath& candidate) const {
        if (candidate.elements_.size() <= elements_.size()) {
            return false;
        }
        for (size_t i = 0; i < elements_.size(); ++i) {
            if (elements_[i] != candidate.elements_[i]) {
                return false;
            }
        }
        return true;
    }

    std::string DerivationPath::toString() const {
        if (elements_.empty()) {
            return "/";
        }
        std::string out;
        for (const PathElement& e : elements_) {
            out += "/" + std::to_string(e.index);
            if (e.hardened) {
                out += "'";
            }
        }
        return out;
    }

    ExtendedKey ExtendedKey::deriveFrom(const std::string& parentPath, const std::string& childPath) const {
        DerivationPath parent = DerivationPath::parse(parentPath);
        DerivationPath descendant = DerivationPath::parse(childPath);

        if (parent != descendant && !parent.isParentOf(descendant)) {
            throw ParseFailure("Path " + descendant.toString() + " is not descended from " + parent.toString());
        }

        ExtendedKey current = *this;
        const std::vector<PathElement>& steps = descendant.elements();
        for (size_t i = parent.size(); i < steps.size(); ++i) {
            current = steps[i].hardened ? current.hardenedChild(steps[i].index)
                                        : current.child(steps[i].index);
        }
        return current;
    }

} // namespace Sigil
