/***
 * Name: CatalogIntrospector (definitions)
 * Purpose: Serve class loads and reflective member searches from a fixed catalog.
 */
#include "archlink/introspect/CatalogIntrospector.h"

#include <deque>
#include <unordered_set>
#include <utility>

namespace archlink::introspect {

    CatalogIntrospector::CatalogIntrospector(std::vector<model::ClassInfo> classes) {
        for (auto &info : classes) {
            info.origin = model::ClassOrigin::Introspected;
            for (auto &member : info.members) {
                if (!member.handle) {
                    member.handle = model::MemberHandle{"catalog:" + info.name + "#" + member.name + member.descriptor};
                }
            }
            std::string key = info.name;
            classes_.insert_or_assign(std::move(key), std::move(info));
        }
    }

    /*** Name: CatalogIntrospector::find */
    const model::ClassInfo *CatalogIntrospector::find(const std::string &typeName) const {
        const auto it = classes_.find(typeName);
        return it == classes_.end() ? nullptr : &it->second;
    }

    /*** Name: CatalogIntrospector::loadClass */
    std::optional<model::ClassInfo> CatalogIntrospector::loadClass(const std::string &typeName) const {
        const auto *info = find(typeName);
        if (info == nullptr) return std::nullopt;
        return *info;
    }

    /*** Name: CatalogIntrospector::isSupertypeOf */
    bool CatalogIntrospector::isSupertypeOf(const std::string &ancestor, const std::string &descendant) const {
        std::deque<std::string> queue{descendant};
        std::unordered_set<std::string> seen;
        while (!queue.empty()) {
            const std::string current = queue.front();
            queue.pop_front();
            if (!seen.insert(current).second) continue;
            const auto *info = find(current);
            if (info == nullptr) continue;
            if (info->superclass) {
                if (*info->superclass == ancestor) return true;
                queue.push_back(*info->superclass);
            }
            for (const auto &iface : info->interfaces) {
                if (iface == ancestor) return true;
                queue.push_back(iface);
            }
        }
        return false;
    }

    /*** Name: CatalogIntrospector::findMembers */
    std::vector<IntrospectedMember> CatalogIntrospector::findMembers(const std::string &typeName,
                                                                     const model::MemberKind kind,
                                                                     const MemberPredicate &predicate) const {
        std::vector<IntrospectedMember> out;
        std::deque<std::string> queue{typeName};
        std::unordered_set<std::string> seen;
        while (!queue.empty()) {
            const std::string current = queue.front();
            queue.pop_front();
            if (!seen.insert(current).second) continue;
            const auto *info = find(current);
            if (info == nullptr) continue;
            for (const auto &member : info->members) {
                if (member.kind != kind || !predicate(member)) continue;
                bool overridden = false;
                for (const auto &found : out) {
                    if (found.member.name == member.name && found.member.descriptor == member.descriptor &&
                        isSupertypeOf(current, found.declaringClass)) {
                        overridden = true;
                        break;
                    }
                }
                if (!overridden) out.push_back(IntrospectedMember{current, member});
            }
            if (kind == model::MemberKind::Constructor) break;
            if (info->superclass) queue.push_back(*info->superclass);
            queue.insert(queue.end(), info->interfaces.begin(), info->interfaces.end());
        }
        return out;
    }

} // namespace archlink::introspect
