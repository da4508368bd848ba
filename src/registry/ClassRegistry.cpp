/***
 * Name: ClassRegistry (definitions)
 * Purpose: Concurrent upsert, lazy loading, and subclass index maintenance.
 */
#include "archlink/registry/ClassRegistry.h"
#include "archlink/exceptions/model_inconsistency_error.h"

#include <algorithm>
#include <deque>
#include <mutex>
#include <utility>

namespace archlink::registry {

    ClassRegistry::ClassRegistry(std::shared_ptr<const introspect::Introspector> introspector)
        : introspector_(std::move(introspector)) {}

    /*** Name: ClassRegistry::get */
    model::ClassPtr ClassRegistry::get(const std::string &name) const {
        std::shared_lock lock(mutex_);
        const auto it = classes_.find(name);
        return it == classes_.end() ? nullptr : it->second;
    }

    /*** Name: ClassRegistry::put(ClassInfo) */
    model::ClassPtr ClassRegistry::put(const model::ClassInfo &info) {
        return put(model::ClassDescriptor::create(info));
    }

    /*** Name: ClassRegistry::put(ClassPtr) */
    model::ClassPtr ClassRegistry::put(model::ClassPtr cls) {
        if (phase() == RegistryPhase::Completed) {
            throw exceptions::ModelInconsistencyError("cannot register '" + cls->name() +
                                                      "': class registry is already completed");
        }
        std::unique_lock lock(mutex_);
        auto &slot = classes_[cls->name()];
        if (slot) { unindexLocked(*slot); }
        slot = std::move(cls);
        indexLocked(*slot);
        return slot;
    }

    /*** Name: ClassRegistry::getOrLoad */
    model::ClassPtr ClassRegistry::getOrLoad(const std::string &name) {
        if (auto existing = get(name)) { return existing; }
        if (!introspector_) { return nullptr; }
        auto info = introspector_->loadClass(name);
        if (!info) { return nullptr; }
        info->name = name;
        info->origin = model::ClassOrigin::Introspected;
        auto loaded = model::ClassDescriptor::create(*info);

        std::unique_lock lock(mutex_);
        const auto [it, inserted] = classes_.try_emplace(name, std::move(loaded));
        if (inserted) { indexLocked(*it->second); }
        return it->second;
    }

    /*** Name: ClassRegistry::contains */
    bool ClassRegistry::contains(const std::string &name) const {
        std::shared_lock lock(mutex_);
        return classes_.contains(name);
    }

    /*** Name: ClassRegistry::size */
    std::size_t ClassRegistry::size() const {
        std::shared_lock lock(mutex_);
        return classes_.size();
    }

    /*** Name: ClassRegistry::allClasses */
    std::vector<model::ClassPtr> ClassRegistry::allClasses() const {
        std::vector<model::ClassPtr> out;
        {
            std::shared_lock lock(mutex_);
            out.reserve(classes_.size());
            for (const auto &entry : classes_) { out.push_back(entry.second); }
        }
        std::sort(out.begin(), out.end(),
                  [](const model::ClassPtr &a, const model::ClassPtr &b) { return a->name() < b->name(); });
        return out;
    }

    /*** Name: ClassRegistry::directSubclasses */
    std::vector<std::string> ClassRegistry::directSubclasses(const std::string &name) const {
        std::shared_lock lock(mutex_);
        const auto it = subclasses_.find(name);
        if (it == subclasses_.end()) return {};
        return std::vector<std::string>(it->second.begin(), it->second.end());
    }

    /*** Name: ClassRegistry::allSubclasses */
    std::unordered_set<std::string> ClassRegistry::allSubclasses(const std::string &name) const {
        std::unordered_set<std::string> out;
        std::shared_lock lock(mutex_);
        std::deque<std::string> queue{name};
        while (!queue.empty()) {
            const auto it = subclasses_.find(queue.front());
            queue.pop_front();
            if (it == subclasses_.end()) continue;
            for (const auto &sub : it->second) {
                if (out.insert(sub).second) { queue.push_back(sub); }
            }
        }
        return out;
    }

    /*** Name: ClassRegistry::indexLocked */
    void ClassRegistry::indexLocked(const model::ClassDescriptor &cls) {
        for (const auto &super : cls.directSupertypes()) { subclasses_[super].insert(cls.name()); }
    }

    /*** Name: ClassRegistry::unindexLocked */
    void ClassRegistry::unindexLocked(const model::ClassDescriptor &cls) {
        for (const auto &super : cls.directSupertypes()) {
            const auto it = subclasses_.find(super);
            if (it == subclasses_.end()) continue;
            it->second.erase(cls.name());
            if (it->second.empty()) { subclasses_.erase(it); }
        }
    }

} // namespace archlink::registry
