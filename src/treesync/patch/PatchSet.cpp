#include "patch/PatchSet.hpp"

#include <algorithm>

namespace TS {

void mergeUpdate(Update& into, Update const& from) {
    if (from.changedName) {
        into.changedName = from.changedName;
    }
    if (from.changedClassName) {
        into.changedClassName = from.changedClassName;
    }
    if (from.changedMetadata) {
        if (into.changedMetadata && into.changedMetadata->is_object() && from.changedMetadata->is_object()) {
            into.changedMetadata->update(*from.changedMetadata);
        } else {
            into.changedMetadata = from.changedMetadata;
        }
    }
    for (auto const& [name, value] : from.changedProperties) {
        into.changedProperties.insert_or_assign(name, value);
    }
}

auto PatchSet::countChanges() const -> std::size_t {
    std::size_t count = removed.size() + added.size();
    for (auto const& update : updated) {
        count += update.changedProperties.size();
        if (update.changedName)
            ++count;
        if (update.changedClassName)
            ++count;
        if (update.changedMetadata)
            ++count;
    }
    return count;
}

bool PatchSet::containsId(Id const& id) const {
    if (added.contains(id)) {
        return true;
    }
    if (findUpdate(id)) {
        return true;
    }
    return std::any_of(removed.begin(), removed.end(), [&](RemovedTarget const& target) {
        auto const* removedId = std::get_if<Id>(&target);
        return removedId && *removedId == id;
    });
}

auto PatchSet::findUpdate(Id const& id) const -> Update const* {
    auto it = std::find_if(updated.begin(), updated.end(), [&](Update const& update) { return update.id == id; });
    return it == updated.end() ? nullptr : &*it;
}

auto PatchSet::updateFor(Id const& id) -> Update& {
    auto it = std::find_if(updated.begin(), updated.end(), [&](Update const& update) { return update.id == id; });
    if (it != updated.end()) {
        return *it;
    }
    updated.push_back(Update{.id = id});
    return updated.back();
}

auto PatchSet::assign(PatchSet const& other) -> PatchSet& {
    removed.insert(removed.end(), other.removed.begin(), other.removed.end());
    for (auto const& [id, instance] : other.added) {
        added.insert_or_assign(id, instance);
    }
    for (auto const& update : other.updated) {
        mergeUpdate(updateFor(update.id), update);
    }
    return *this;
}

} // namespace TS
