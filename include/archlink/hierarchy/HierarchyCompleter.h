/***
 * Name: archlink::hierarchy::HierarchyCompleter
 * Purpose: Ensure every ancestor of every registered class is itself registered.
 * Inputs:
 *   - ClassRegistry populated by the scanner
 * Outputs:
 *   - CompletionReport: number of classes added and missing-dependency warnings
 * Theory of Operation:
 *   Worklist fixed point. Each registered class's direct supertypes are
 *   looked up; unregistered ones are loaded through the registry's lazy path
 *   and queued so their own ancestry is completed too. The loop ends when a
 *   pass adds nothing. An ancestor that cannot be loaded is reported once per
 *   (class, ancestor) edge and the edge is left absent; completion never
 *   aborts. The registry is marked Completed at the end.
 */
#pragma once

#include <cstddef>
#include <vector>

#include "archlink/diag/Diagnostic.h"
#include "archlink/registry/ClassRegistry.h"

namespace archlink::hierarchy {

struct CompletionReport {
    std::size_t added{0};
    std::vector<diag::Diagnostic> warnings{};
};

class HierarchyCompleter {
public:
    explicit HierarchyCompleter(registry::ClassRegistry &registry) : registry_(registry) {}

    CompletionReport run();

private:
    registry::ClassRegistry &registry_;
};

} // namespace archlink::hierarchy
