/***
 * Name: archlink::model::parseModifierWord
 * Purpose: Map a modifier word from a scan dump to its access flag.
 */
#include "archlink/model/Modifiers.h"

namespace archlink::model {

std::optional<Modifiers> parseModifierWord(const std::string_view word) {
    using namespace modifier;
    if (word == "public") { return kPublic; }
    if (word == "private") { return kPrivate; }
    if (word == "protected") { return kProtected; }
    if (word == "static") { return kStatic; }
    if (word == "final") { return kFinal; }
    if (word == "synchronized") { return kSynchronized; }
    if (word == "volatile") { return kVolatile; }
    if (word == "transient") { return kTransient; }
    if (word == "native") { return kNative; }
    if (word == "interface") { return kInterface | kAbstract; }
    if (word == "abstract") { return kAbstract; }
    if (word == "synthetic") { return kSynthetic; }
    if (word == "enum") { return kEnum; }
    return std::nullopt;
}

} // namespace archlink::model
