/***
 * Name: archlink::registry::ClassRegistry
 * Purpose: Name-keyed store of class descriptors shared by every analysis stage.
 * Inputs:
 *   - ClassInfo / ClassPtr puts from scanner workers
 *   - Lazy load requests for names nobody registered
 * Outputs:
 *   - Lookups by name, a name-sorted snapshot, and a subclass index
 * Theory of Operation:
 *   A shared_mutex guards the map and the subclass index, so concurrent
 *   scanner puts and resolver lookups need no external locking. put() is a
 *   last-write-wins upsert. getOrLoad() asks the Introspector outside the
 *   lock and inserts with try_emplace, so duplicate concurrent loads of one
 *   name converge on the first inserted descriptor. The subclass index maps
 *   each supertype name to the names of classes that directly extend or
 *   implement it and is maintained on every insert.
 *
 *   Lifecycle: Populating (scanner puts allowed) -> Completed (after
 *   hierarchy completion; puts raise ModelInconsistencyError, lazy loads
 *   remain allowed).
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "archlink/introspect/Introspector.h"
#include "archlink/model/ClassDescriptor.h"

namespace archlink::registry {

enum class RegistryPhase { Populating, Completed };

class ClassRegistry {
public:
    explicit ClassRegistry(std::shared_ptr<const introspect::Introspector> introspector = nullptr);

    ClassRegistry(const ClassRegistry &) = delete;
    ClassRegistry &operator=(const ClassRegistry &) = delete;

    // Null when the name is not registered.
    model::ClassPtr get(const std::string &name) const;

    model::ClassPtr put(const model::ClassInfo &info);
    model::ClassPtr put(model::ClassPtr cls);

    // Registered descriptor, or one loaded through the introspector; null when neither has it.
    model::ClassPtr getOrLoad(const std::string &name);

    bool contains(const std::string &name) const;
    std::size_t size() const;
    std::vector<model::ClassPtr> allClasses() const;

    std::vector<std::string> directSubclasses(const std::string &name) const;
    std::unordered_set<std::string> allSubclasses(const std::string &name) const;

    void markCompleted() { phase_.store(RegistryPhase::Completed); }
    RegistryPhase phase() const { return phase_.load(); }

    const introspect::Introspector *introspector() const { return introspector_.get(); }

private:
    void indexLocked(const model::ClassDescriptor &cls);
    void unindexLocked(const model::ClassDescriptor &cls);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, model::ClassPtr> classes_;
    std::unordered_map<std::string, std::set<std::string>> subclasses_;
    std::shared_ptr<const introspect::Introspector> introspector_;
    std::atomic<RegistryPhase> phase_{RegistryPhase::Populating};
};

} // namespace archlink::registry
