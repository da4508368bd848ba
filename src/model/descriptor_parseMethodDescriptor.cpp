/***
 * Name: archlink::model::parseMethodDescriptor
 * Purpose: Parse "(ParameterDescriptor*)ReturnDescriptor" into a TypeSignature.
 */
#include "archlink/model/Descriptor.h"
#include "archlink/exceptions/descriptor_error.h"

namespace archlink::model {

TypeSignature parseMethodDescriptor(const std::string_view desc) {
    if (desc.empty() || desc.front() != '(') {
        throw exceptions::DescriptorError("method descriptor must start with '(': '" + std::string(desc) + "'");
    }
    TypeSignature sig;
    std::size_t pos = 1;
    while (pos < desc.size() && desc[pos] != ')') {
        sig.parameterTypes.push_back(parseFieldType(desc, pos));
    }
    if (pos >= desc.size()) {
        throw exceptions::DescriptorError("missing ')' in method descriptor '" + std::string(desc) + "'");
    }
    ++pos;
    if (pos < desc.size() && desc[pos] == 'V') {
        sig.returnType = "void";
        ++pos;
    } else {
        sig.returnType = parseFieldType(desc, pos);
    }
    if (pos != desc.size()) {
        throw exceptions::DescriptorError("trailing characters in method descriptor '" + std::string(desc) + "'");
    }
    return sig;
}

} // namespace archlink::model
