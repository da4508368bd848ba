/***
 * Name: archlink::hierarchy (supertype queries)
 * Purpose: Walk the ancestry of a class through the registry.
 */
#pragma once

#include <string>
#include <vector>

#include "archlink/model/ClassDescriptor.h"
#include "archlink/registry/ClassRegistry.h"

namespace archlink::hierarchy {

/** Breadth-first ancestors of `start` (itself excluded): superclass before interfaces, each once.
 *  Ancestors the registry cannot provide are skipped. */
std::vector<model::ClassPtr> supertypeClosure(registry::ClassRegistry &registry, const model::ClassDescriptor &start);

/** True when `ancestor` is a proper supertype of `descendant`. */
bool isSupertypeOf(registry::ClassRegistry &registry, const std::string &ancestor,
                   const model::ClassDescriptor &descendant);

} // namespace archlink::hierarchy
