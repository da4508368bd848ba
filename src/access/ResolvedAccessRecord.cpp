/***
 * Name: archlink::access::ResolvedAccessRecord::toString
 * Purpose: "<caller> -> <kind> <target> line <n> [<binding>]"
 */
#include "archlink/access/ResolvedAccessRecord.h"

namespace archlink::access {

std::string ResolvedAccessRecord::toString() const {
    std::string out = caller->toString() + " -> " + std::string(accessKindName(kind));
    if (accessType) { out += "(" + std::string(accessTypeName(*accessType)) + ")"; }
    out += " " + target->toString();
    if (line >= 0) { out += " line " + std::to_string(line); }
    out += " [" + std::string(resolve::bindingKindName(binding)) + "]";
    return out;
}

} // namespace archlink::access
