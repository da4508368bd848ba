/***
 * Name: archlink::model::CodeUnit
 * Purpose: Identity of a calling method, constructor, or static initializer.
 */
#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <string>

namespace archlink::model {

struct CodeUnit {
    std::string declaringClass;
    std::string name;
    std::string descriptor;

    auto operator<=>(const CodeUnit &other) const = default;

    std::string toString() const { return declaringClass + "." + name + descriptor; }
};

struct CodeUnitHash {
    std::size_t operator()(const CodeUnit &unit) const noexcept {
        const std::hash<std::string> hasher;
        std::size_t seed = hasher(unit.declaringClass);
        seed ^= hasher(unit.name) + 0x9e3779b9U + (seed << 6U) + (seed >> 2U);
        seed ^= hasher(unit.descriptor) + 0x9e3779b9U + (seed << 6U) + (seed >> 2U);
        return seed;
    }
};

} // namespace archlink::model
