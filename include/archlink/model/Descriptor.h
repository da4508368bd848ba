/***
 * Name: archlink::model (descriptors)
 * Purpose: Parse JVM field and method descriptors into readable type names.
 * Inputs:
 *   - Descriptor text as recorded in class files ("(ILjava/lang/String;)V")
 * Outputs:
 *   - Dotted type names ("int", "java.lang.String", "long[][]")
 * Theory of Operation:
 *   A small recursive-descent reader over the descriptor grammar of the JVM
 *   specification (4.3). Malformed input raises DescriptorError.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "archlink/model/MemberKind.h"

namespace archlink::model {

/***
 * Name: TypeSignature
 * Purpose: Structured form of a descriptor. Fields carry only returnType (the field type).
 */
struct TypeSignature {
    std::vector<std::string> parameterTypes;
    std::string returnType;

    bool operator==(const TypeSignature& other) const = default;
};

/** Read one field type starting at pos; advances pos past it. */
std::string parseFieldType(std::string_view desc, std::size_t& pos);

/** Parse a complete field descriptor ("J", "[Ljava/lang/Object;"). */
std::string parseFieldDescriptor(std::string_view desc);

/** Parse a complete method descriptor ("(IJ)Ljava/lang/String;"). */
TypeSignature parseMethodDescriptor(std::string_view desc);

/** Field descriptors for fields, method descriptors for methods and constructors. */
TypeSignature signatureOf(MemberKind kind, std::string_view desc);

/** Normalise an owner reference (internal name "a/b/C" or array descriptor "[I") to a dotted name. */
std::string ownerTypeName(std::string_view owner);

} // namespace archlink::model
