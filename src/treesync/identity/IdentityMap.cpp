#include "identity/IdentityMap.hpp"

#include "log/TaggedLogger.hpp"
#include "tree/LiveTree.hpp"

#include <vector>

namespace TS {

IdentityMap::IdentityMap(LiveTree& tree) : tree(tree) {}

auto IdentityMap::insert(Id const& id, ObjectHandle object) -> Expected<void> {
    if (auto it = fromIds.find(id); it != fromIds.end()) {
        if (it->second == object) {
            return {};
        }
        return std::unexpected(Error{Error::Code::AlreadyBound,
                                     "Id '" + id + "' is already bound to " + describeHandle(it->second)});
    }
    if (auto it = fromObjects.find(object); it != fromObjects.end()) {
        return std::unexpected(Error{Error::Code::AlreadyBound,
                                     "Object " + describeHandle(object) + " is already bound to id '" + it->second + "'"});
    }
    fromIds.emplace(id, object);
    fromObjects.emplace(object, id);
    return {};
}

auto IdentityMap::repoint(Id const& id, ObjectHandle object) -> Expected<void> {
    if (auto it = fromObjects.find(object); it != fromObjects.end() && it->second != id) {
        return std::unexpected(Error{Error::Code::AlreadyBound,
                                     "Object " + describeHandle(object) + " is already bound to id '" + it->second + "'"});
    }
    if (auto it = fromIds.find(id); it != fromIds.end()) {
        fromObjects.erase(it->second);
        it->second = object;
    } else {
        fromIds.emplace(id, object);
    }
    fromObjects.insert_or_assign(object, id);
    return {};
}

auto IdentityMap::byId(Id const& id) const -> std::optional<ObjectHandle> {
    if (auto it = fromIds.find(id); it != fromIds.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto IdentityMap::byObject(ObjectHandle object) const -> std::optional<Id> {
    if (auto it = fromObjects.find(object); it != fromObjects.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto IdentityMap::removeId(Id const& id) -> bool {
    auto it = fromIds.find(id);
    if (it == fromIds.end()) {
        return false;
    }
    fromObjects.erase(it->second);
    fromIds.erase(it);
    return true;
}

auto IdentityMap::removeObject(ObjectHandle object) -> bool {
    auto it = fromObjects.find(object);
    if (it == fromObjects.end()) {
        return false;
    }
    fromIds.erase(it->second);
    fromObjects.erase(it);
    return true;
}

auto IdentityMap::collectSubtree(ObjectHandle object) const -> std::vector<ObjectHandle> {
    std::vector<ObjectHandle> pending{object};
    std::vector<ObjectHandle> subtree;
    while (!pending.empty()) {
        auto const current = pending.back();
        pending.pop_back();
        subtree.push_back(current);
        if (auto children = tree.children(current)) {
            pending.insert(pending.end(), children->begin(), children->end());
        }
    }
    return subtree;
}

auto IdentityMap::destroyId(Id const& id) -> Expected<void> {
    auto object = byId(id);
    if (!object) {
        return std::unexpected(Error{Error::Code::UnknownId, "Id '" + id + "' is not bound to a live object"});
    }
    return destroyObject(*object);
}

auto IdentityMap::destroyObject(ObjectHandle object) -> Expected<void> {
    if (!tree.exists(object)) {
        return std::unexpected(Error{Error::Code::UnknownObject, "No live object " + describeHandle(object)});
    }

    // Collect the subtree first, the tree cannot enumerate it afterwards.
    auto const subtree = collectSubtree(object);

    if (auto destroyed = tree.destroy(object); !destroyed) {
        return destroyed;
    }

    for (auto handle : subtree) {
        removeObject(handle);
        suppressed.erase(handle);
    }
    ts_log("IdentityMap destroyed " + describeHandle(object) + " with " + std::to_string(subtree.size() - 1)
                   + " descendants",
           "IdentityMap",
           "TRACE");
    return {};
}

void IdentityMap::suppress(ObjectHandle object) {
    suppressed.insert(object);
}

bool IdentityMap::isSuppressed(ObjectHandle object) const {
    return suppressed.contains(object);
}

void IdentityMap::endCycle() {
    suppressed.clear();
}

void IdentityMap::clear() {
    fromIds.clear();
    fromObjects.clear();
    suppressed.clear();
}

} // namespace TS
