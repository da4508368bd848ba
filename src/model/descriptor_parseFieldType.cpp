/***
 * Name: archlink::model::parseFieldType
 * Purpose: Read one FieldType production from a descriptor.
 * Inputs:
 *   - desc: full descriptor text
 *   - pos: index of the first character of the field type
 * Outputs:
 *   - Dotted type name; pos advanced past the consumed characters
 * Theory of Operation:
 *   Base types map to their keywords, object types drop the L...; wrapper and
 *   swap '/' for '.', arrays append one "[]" per dimension. More than 255
 *   dimensions is a DescriptorError, as in the class file format.
 */
#include "archlink/model/Descriptor.h"
#include "archlink/exceptions/descriptor_error.h"

#include <algorithm>

namespace archlink::model {

namespace {
constexpr std::size_t kMaxArrayDimensions = 255;
} // namespace

static std::string objectTypeName(const std::string_view desc, std::size_t &pos) {
    const auto end = desc.find(';', pos);
    if (end == std::string_view::npos || end == pos + 1) {
        throw exceptions::DescriptorError("unterminated object type in descriptor '" + std::string(desc) + "'");
    }
    std::string name(desc.substr(pos + 1, end - pos - 1));
    std::replace(name.begin(), name.end(), '/', '.');
    pos = end + 1;
    return name;
}

static std::string elementTypeName(const std::string_view desc, std::size_t &pos) {
    if (pos >= desc.size()) {
        throw exceptions::DescriptorError("unexpected end of descriptor '" + std::string(desc) + "'");
    }
    switch (desc[pos]) {
        case 'B': ++pos; return "byte";
        case 'C': ++pos; return "char";
        case 'D': ++pos; return "double";
        case 'F': ++pos; return "float";
        case 'I': ++pos; return "int";
        case 'J': ++pos; return "long";
        case 'S': ++pos; return "short";
        case 'Z': ++pos; return "boolean";
        case 'L': return objectTypeName(desc, pos);
        default: break;
    }
    throw exceptions::DescriptorError("invalid type tag '" + std::string(1, desc[pos]) + "' in descriptor '" +
                                      std::string(desc) + "'");
}

std::string parseFieldType(const std::string_view desc, std::size_t &pos) {
    std::size_t dimensions = 0;
    while (pos < desc.size() && desc[pos] == '[') {
        if (++dimensions > kMaxArrayDimensions) {
            throw exceptions::DescriptorError("more than 255 array dimensions in descriptor '" + std::string(desc) +
                                              "'");
        }
        ++pos;
    }
    std::string name = elementTypeName(desc, pos);
    for (std::size_t i = 0; i < dimensions; ++i) { name += "[]"; }
    return name;
}

} // namespace archlink::model
