/***
 * Name: ClassDescriptor (definitions)
 * Purpose: Build owned members from ClassInfo and answer declaration queries.
 */
#include "archlink/model/ClassDescriptor.h"

#include <algorithm>
#include <iterator>

namespace archlink::model {

    ClassDescriptor::ClassDescriptor(const ClassInfo &info)
        : name_(info.name),
          superclass_(info.superclass),
          interfaces_(info.interfaces),
          modifiers_(info.modifiers),
          origin_(info.origin) {
        members_.reserve(info.members.size());
        for (const auto &member : info.members) {
            members_.push_back(std::make_shared<const MemberDescriptor>(name_, member));
        }
    }

    /*** Name: ClassDescriptor::directSupertypes */
    std::vector<std::string> ClassDescriptor::directSupertypes() const {
        std::vector<std::string> out;
        out.reserve(interfaces_.size() + 1);
        if (superclass_) { out.push_back(*superclass_); }
        out.insert(out.end(), interfaces_.begin(), interfaces_.end());
        return out;
    }

    /*** Name: ClassDescriptor::membersOfKind */
    std::vector<MemberPtr> ClassDescriptor::membersOfKind(const MemberKind kind) const {
        std::vector<MemberPtr> out;
        std::copy_if(members_.begin(), members_.end(), std::back_inserter(out),
                     [kind](const MemberPtr &m) { return m->kind() == kind; });
        return out;
    }

    /*** Name: ClassDescriptor::codeUnits */
    std::vector<MemberPtr> ClassDescriptor::codeUnits() const {
        std::vector<MemberPtr> out;
        std::copy_if(members_.begin(), members_.end(), std::back_inserter(out),
                     [](const MemberPtr &m) { return m->kind() != MemberKind::Field; });
        return out;
    }

    /*** Name: ClassDescriptor::findDeclared */
    MemberPtr ClassDescriptor::findDeclared(const MemberKind kind, const std::string &name,
                                            const std::string &descriptor) const {
        const auto it = std::find_if(members_.begin(), members_.end(), [&](const MemberPtr &m) {
            return m->kind() == kind && m->hasSignature(name, descriptor);
        });
        return it == members_.end() ? nullptr : *it;
    }

    /*** Name: ClassDescriptor::operator== */
    bool ClassDescriptor::operator==(const ClassDescriptor &other) const {
        if (name_ != other.name_ || superclass_ != other.superclass_ || interfaces_ != other.interfaces_ ||
            modifiers_ != other.modifiers_ || members_.size() != other.members_.size()) {
            return false;
        }
        return std::equal(members_.begin(), members_.end(), other.members_.begin(),
                          [](const MemberPtr &a, const MemberPtr &b) { return *a == *b; });
    }

} // namespace archlink::model
