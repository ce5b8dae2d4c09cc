#pragma once

#include "core/Id.hpp"
#include "patch/VirtualValue.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace TS {

// Desired state of one node.
struct VirtualInstance {
    std::string       className;
    std::string       name;
    std::optional<Id> parent;
    PropertyMap       properties;
    std::vector<Id>   children;

    friend bool operator==(VirtualInstance const&, VirtualInstance const&) = default;
};

struct Update {
    Id                            id;
    std::optional<std::string>    changedName;
    std::optional<std::string>    changedClassName;
    PropertyMap                   changedProperties;
    std::optional<nlohmann::json> changedMetadata;

    [[nodiscard]] bool isEmpty() const noexcept {
        return !changedName && !changedClassName && changedProperties.empty() && !changedMetadata;
    }

    friend bool operator==(Update const&, Update const&) = default;
};

// Removals address a node by id, or a live object directly.
using RemovedTarget = std::variant<Id, ObjectHandle>;

/**
 * A set of additions, removals and updates.
 *
 * The same shape describes an incoming patch and the unapplied remainder the
 * engine returns. Updates are kept with at most one record per id once they
 * pass through assign() or updateFor().
 */
struct PatchSet {
    std::vector<RemovedTarget>     removed;
    std::map<Id, VirtualInstance>  added;
    std::vector<Update>            updated;

    [[nodiscard]] bool isEmpty() const noexcept { return removed.empty() && added.empty() && updated.empty(); }
    [[nodiscard]] auto countChanges() const -> std::size_t;
    [[nodiscard]] bool containsId(Id const& id) const;
    [[nodiscard]] auto findUpdate(Id const& id) const -> Update const*;

    // Returns the record for `id`, creating an empty one if needed.
    auto updateFor(Id const& id) -> Update&;

    // Appends removals, merges additions and coalesces updates by id.
    auto assign(PatchSet const& other) -> PatchSet&;

    friend bool operator==(PatchSet const&, PatchSet const&) = default;
};

using Patch = PatchSet;

/**
 * Merges `from` into `into` (same id). Changed properties are unioned with
 * `from` winning on key conflicts; name and class are taken from `from` when
 * it carries them. Metadata objects are unioned the same way as properties;
 * any other metadata from `from` replaces what `into` held.
 */
void mergeUpdate(Update& into, Update const& from);

} // namespace TS
