/***
 * Name: archlink::access::TargetInfo
 * Purpose: The statically recorded reference at an access site: declared owner,
 *   member name, descriptor. This is what the bytecode named, before
 *   hierarchy-aware binding.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace archlink::access {

struct TargetInfo {
    std::string owner; // dotted type name
    std::string name;
    std::string descriptor;

    // Normalises an internal-name or array-descriptor owner; throws DescriptorError on malformed owners.
    static TargetInfo of(std::string_view rawOwner, std::string name, std::string descriptor);

    bool operator==(const TargetInfo &other) const = default;

    std::string toString() const { return "{owner='" + owner + "', name='" + name + "', desc='" + descriptor + "'}"; }
};

struct TargetInfoHash {
    std::size_t operator()(const TargetInfo &target) const noexcept {
        const std::hash<std::string> hasher;
        std::size_t seed = hasher(target.owner);
        seed ^= hasher(target.name) + 0x9e3779b9U + (seed << 6U) + (seed >> 2U);
        seed ^= hasher(target.descriptor) + 0x9e3779b9U + (seed << 6U) + (seed >> 2U);
        return seed;
    }
};

} // namespace archlink::access
