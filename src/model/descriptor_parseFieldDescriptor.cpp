/***
 * Name: archlink::model::parseFieldDescriptor
 * Purpose: Parse a complete field descriptor; trailing characters are an error.
 */
#include "archlink/model/Descriptor.h"
#include "archlink/exceptions/descriptor_error.h"

namespace archlink::model {

std::string parseFieldDescriptor(const std::string_view desc) {
    std::size_t pos = 0;
    std::string type = parseFieldType(desc, pos);
    if (pos != desc.size()) {
        throw exceptions::DescriptorError("trailing characters in field descriptor '" + std::string(desc) + "'");
    }
    return type;
}

} // namespace archlink::model
