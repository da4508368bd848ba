/***
 * Name: archlink::model (modifiers)
 * Purpose: JVM access flags carried by classes and members.
 * Inputs: Raw access flag words from the scanner or introspector
 * Outputs: Bit tests and readable modifier lists
 * Theory of Operation:
 *   Values equal the class file access_flags bits so scanner output can be
 *   stored unchanged. Word parsing backs the scan dump reader.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace archlink::model {

using Modifiers = std::uint32_t;

namespace modifier {
inline constexpr Modifiers kPublic = 0x0001;
inline constexpr Modifiers kPrivate = 0x0002;
inline constexpr Modifiers kProtected = 0x0004;
inline constexpr Modifiers kStatic = 0x0008;
inline constexpr Modifiers kFinal = 0x0010;
inline constexpr Modifiers kSynchronized = 0x0020;
inline constexpr Modifiers kVolatile = 0x0040;
inline constexpr Modifiers kTransient = 0x0080;
inline constexpr Modifiers kNative = 0x0100;
inline constexpr Modifiers kInterface = 0x0200;
inline constexpr Modifiers kAbstract = 0x0400;
inline constexpr Modifiers kSynthetic = 0x1000;
inline constexpr Modifiers kEnum = 0x4000;
} // namespace modifier

inline bool hasModifier(Modifiers mods, Modifiers flag) { return (mods & flag) != 0U; }

/** Space-separated modifier words in declaration order ("public static final"). */
std::string describeModifiers(Modifiers mods);

/** Map one modifier word ("public", "abstract", ...) to its flag. */
std::optional<Modifiers> parseModifierWord(std::string_view word);

} // namespace archlink::model
