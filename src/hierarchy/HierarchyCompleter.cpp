/***
 * Name: archlink::hierarchy::HierarchyCompleter::run
 * Purpose: Complete the registry's ancestry to a fixed point.
 */
#include "archlink/hierarchy/HierarchyCompleter.h"
#include "archlink/exceptions/descriptor_error.h"
#include "archlink/exceptions/missing_dependency_error.h"

#include <deque>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>

namespace archlink::hierarchy {

CompletionReport HierarchyCompleter::run() {
    CompletionReport report;
    const auto initial = registry_.allClasses();
    std::deque<model::ClassPtr> work(initial.begin(), initial.end());
    std::unordered_set<std::string> unloadable;
    std::set<std::pair<std::string, std::string>> reported;

    auto reportMissing = [&](const std::string &className, const std::string &missing, const std::string &detail) {
        if (!reported.emplace(className, missing).second) return;
        std::string message = "Can't analyse related type of '" + className +
                              "' because of missing dependency '" + missing + "'";
        if (!detail.empty()) { message += ". Error was: '" + detail + "'"; }
        report.warnings.push_back(diag::warning(std::move(message), className));
    };

    while (!work.empty()) {
        const auto cls = work.front();
        work.pop_front();
        for (const auto &super : cls->directSupertypes()) {
            if (registry_.contains(super)) continue;
            if (unloadable.contains(super)) {
                reportMissing(cls->name(), super, "");
                continue;
            }
            model::ClassPtr loaded;
            try {
                loaded = registry_.getOrLoad(super);
            } catch (const exceptions::MissingDependencyError &e) {
                unloadable.insert(super);
                reportMissing(cls->name(), super, e.what());
                continue;
            } catch (const exceptions::DescriptorError &e) {
                // A malformed introspected class counts as unloadable.
                unloadable.insert(super);
                reportMissing(cls->name(), super, e.what());
                continue;
            }
            if (!loaded) {
                unloadable.insert(super);
                reportMissing(cls->name(), super, "");
                continue;
            }
            ++report.added;
            work.push_back(std::move(loaded));
        }
    }
    registry_.markCompleted();
    return report;
}

} // namespace archlink::hierarchy
