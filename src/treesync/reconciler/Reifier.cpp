#include "reconciler/Reifier.hpp"

#include "identity/IdentityMap.hpp"
#include "log/TaggedLogger.hpp"
#include "reconciler/PropertyApplication.hpp"
#include "reconciler/ReconcileContext.hpp"
#include "tree/LiveTree.hpp"

#include <string>

namespace TS {

namespace {

// Records `id` and every declared descendant as unapplied additions.
void addAllToPatch(PatchSet& failures, std::map<Id, VirtualInstance> const& added, Id const& id) {
    std::vector<Id> pending{id};
    while (!pending.empty()) {
        auto current = std::move(pending.back());
        pending.pop_back();
        auto it = added.find(current);
        if (it == added.end()) {
            continue;
        }
        failures.added.insert_or_assign(current, it->second);
        pending.insert(pending.end(), it->second.children.begin(), it->second.children.end());
    }
}

} // namespace

auto Reifier::reifyInstance(std::vector<DeferredRef>&            deferredRefs,
                            std::map<Id, VirtualInstance> const& added,
                            Id const&                            rootId,
                            ObjectHandle                         parent,
                            Mode                                 mode) -> Expected<PatchSet> {
    PatchSet failures;
    if (auto result = reifyInner(failures, deferredRefs, added, rootId, parent, mode); !result) {
        return std::unexpected(result.error());
    }
    return failures;
}

auto Reifier::reifyInner(PatchSet&                            failures,
                         std::vector<DeferredRef>&            deferredRefs,
                         std::map<Id, VirtualInstance> const& added,
                         Id const&                            id,
                         ObjectHandle                         parent,
                         Mode                                 mode) -> Expected<void> {
    auto& tree = context.tree;

    if (!tree.exists(parent)) {
        return std::unexpected(Error{Error::Code::MalformedPatch,
                                     "Cannot reify '" + id + "' under missing parent " + describeHandle(parent)});
    }

    auto it = added.find(id);
    if (it == added.end()) {
        return std::unexpected(Error{Error::Code::MalformedPatch,
                                     "Cannot reify '" + id + "', it is not part of the added instances"});
    }
    auto const& virtualInstance = it->second;

    auto object = tree.create(virtualInstance.className, parent);
    if (!object) {
        ts_log("Could not create '" + id + "' of class " + virtualInstance.className + ": "
                       + describeError(object.error()),
               "Reifier",
               "DEBUG");
        addAllToPatch(failures, added, id);
        return {};
    }

    // Writes below must not be echoed back by a two-way watcher.
    context.identities.suppress(*object);

    if (auto renamed = tree.setName(*object, virtualInstance.name); !renamed) {
        failures.updateFor(id).changedName = virtualInstance.name;
    }

    auto bound = mode == Mode::Add ? context.identities.insert(id, *object)
                                   : context.identities.repoint(id, *object);
    if (!bound) {
        return std::unexpected(Error{Error::Code::MalformedPatch, describeError(bound.error())});
    }

    auto unappliedProperties = applyProperties(context, id, *object, virtualInstance.properties, deferredRefs);
    if (!unappliedProperties.empty()) {
        auto& update = failures.updateFor(id);
        for (auto& [name, value] : unappliedProperties) {
            update.changedProperties.insert_or_assign(name, std::move(value));
        }
    }

    for (auto const& childId : virtualInstance.children) {
        if (auto child = reifyInner(failures, deferredRefs, added, childId, *object, Mode::Add); !child) {
            return child;
        }
    }
    return {};
}

} // namespace TS
