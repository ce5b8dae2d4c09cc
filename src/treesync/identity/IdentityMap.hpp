#pragma once

#include "core/Error.hpp"
#include "core/Id.hpp"

#include <cstddef>
#include <optional>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace TS {

class LiveTree;

/**
 * Bidirectional registry between stable ids and live objects.
 *
 * Invariant: the mapping is one-to-one at every instant. insert() refuses to
 * bind an id (or object) that is already bound elsewhere; repoint() is the
 * only way to move an id to another object, and it drops the old object's
 * reverse entry in the same step.
 *
 * Suppression marks objects whose change notifications were produced by the
 * engine itself during the current apply cycle, so a two-way watcher can
 * ignore them. It is not a lock. endCycle() clears every mark.
 *
 * Single-threaded; all lookups are O(1) expected.
 */
class IdentityMap {
public:
    explicit IdentityMap(LiveTree& tree);

    IdentityMap(IdentityMap const&)            = delete;
    IdentityMap& operator=(IdentityMap const&) = delete;

    auto insert(Id const& id, ObjectHandle object) -> Expected<void>;
    auto repoint(Id const& id, ObjectHandle object) -> Expected<void>;

    [[nodiscard]] auto byId(Id const& id) const -> std::optional<ObjectHandle>;
    [[nodiscard]] auto byObject(ObjectHandle object) const -> std::optional<Id>;

    // Drops a binding without touching the live tree.
    auto removeId(Id const& id) -> bool;
    auto removeObject(ObjectHandle object) -> bool;

    // Destroys the live object (and its subtree) and unbinds every destroyed object.
    auto destroyId(Id const& id) -> Expected<void>;
    auto destroyObject(ObjectHandle object) -> Expected<void>;

    void suppress(ObjectHandle object);
    [[nodiscard]] bool isSuppressed(ObjectHandle object) const;
    void endCycle();

    [[nodiscard]] auto size() const noexcept -> std::size_t { return fromIds.size(); }
    void clear();

    /**
     * Ends the apply cycle when it goes out of scope.
     */
    class CycleGuard {
    public:
        explicit CycleGuard(IdentityMap& map) : map(map) {}
        ~CycleGuard() { map.endCycle(); }

        CycleGuard(CycleGuard const&)            = delete;
        CycleGuard& operator=(CycleGuard const&) = delete;

    private:
        IdentityMap& map;
    };

private:
    auto collectSubtree(ObjectHandle object) const -> std::vector<ObjectHandle>;

    LiveTree&                                 tree;
    phmap::flat_hash_map<Id, ObjectHandle>    fromIds;
    phmap::flat_hash_map<ObjectHandle, Id>    fromObjects;
    phmap::flat_hash_set<ObjectHandle>        suppressed;
};

} // namespace TS
