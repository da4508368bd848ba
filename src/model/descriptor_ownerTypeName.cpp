/***
 * Name: archlink::model::ownerTypeName
 * Purpose: Normalise the owner operand of a field or method instruction.
 * Inputs:
 *   - owner: internal name ("java/util/List"), dotted name, or array
 *     descriptor ("[Ljava/lang/Object;") for calls such as clone() on arrays
 * Outputs:
 *   - Dotted type name
 */
#include "archlink/model/Descriptor.h"
#include "archlink/exceptions/descriptor_error.h"

#include <algorithm>

namespace archlink::model {

std::string ownerTypeName(const std::string_view owner) {
    if (owner.empty()) { throw exceptions::DescriptorError("empty owner type"); }
    if (owner.front() == '[') { return parseFieldDescriptor(owner); }
    std::string name(owner);
    std::replace(name.begin(), name.end(), '/', '.');
    return name;
}

} // namespace archlink::model
