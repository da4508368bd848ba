/***
 * Name: archlink::model::signatureOf
 * Purpose: Parse a member descriptor according to the member kind.
 */
#include "archlink/model/Descriptor.h"

namespace archlink::model {

TypeSignature signatureOf(const MemberKind kind, const std::string_view desc) {
    if (kind == MemberKind::Field) {
        TypeSignature sig;
        sig.returnType = parseFieldDescriptor(desc);
        return sig;
    }
    return parseMethodDescriptor(desc);
}

} // namespace archlink::model
