/***
 * Name: archlink::model::describeModifiers
 * Purpose: Render access flags as Java source modifier words.
 */
#include "archlink/model/Modifiers.h"

#include <array>
#include <string_view>
#include <utility>

namespace archlink::model {

namespace {
constexpr std::array<std::pair<Modifiers, std::string_view>, 12> kWords{{
    {modifier::kPublic, "public"},
    {modifier::kProtected, "protected"},
    {modifier::kPrivate, "private"},
    {modifier::kAbstract, "abstract"},
    {modifier::kStatic, "static"},
    {modifier::kFinal, "final"},
    {modifier::kTransient, "transient"},
    {modifier::kVolatile, "volatile"},
    {modifier::kSynchronized, "synchronized"},
    {modifier::kNative, "native"},
    {modifier::kInterface, "interface"},
    {modifier::kSynthetic, "synthetic"},
}};
} // namespace

std::string describeModifiers(const Modifiers mods) {
    std::string out;
    for (const auto &[flag, word] : kWords) {
        if (!hasModifier(mods, flag)) { continue; }
        if (!out.empty()) { out += ' '; }
        out += word;
    }
    return out;
}

} // namespace archlink::model
