/***
 * Name: archlink::access::TargetInfo::of
 * Purpose: Build a TargetInfo with a normalised owner.
 */
#include "archlink/access/TargetInfo.h"
#include "archlink/model/Descriptor.h"

#include <utility>

namespace archlink::access {

TargetInfo TargetInfo::of(const std::string_view rawOwner, std::string name, std::string descriptor) {
    return TargetInfo{model::ownerTypeName(rawOwner), std::move(name), std::move(descriptor)};
}

} // namespace archlink::access
