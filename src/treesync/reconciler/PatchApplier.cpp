#include "reconciler/PatchApplier.hpp"

#include "history/HistoryRecorder.hpp"
#include "log/TaggedLogger.hpp"
#include "patch/PatchJson.hpp"
#include "reconciler/PropertyApplication.hpp"
#include "tree/LiveTree.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <variant>

#include <parallel_hashmap/phmap.h>

namespace TS {

namespace {

void recordVerbatim(PatchSet& unapplied, Update const& update) {
    mergeUpdate(unapplied.updateFor(update.id), update);
}

} // namespace

PatchApplier::PatchApplier(LiveTree&                 tree,
                           PropertySchema const&     schema,
                           IdentityMap&              identities,
                           History::HistoryRecorder* history,
                           ApplyOptions              options)
    : tree(tree)
    , schema(schema)
    , identities(identities)
    , history(history)
    , options_(std::move(options))
    , writer(tree, schema, options_)
    , context{tree, schema, identities, writer, options_}
    , reifier(context) {}

auto PatchApplier::historyLabel() const -> std::string {
    auto const  now      = std::chrono::system_clock::now();
    auto const  nowTimeT = std::chrono::system_clock::to_time_t(now);
    std::tm     nowTm{};
    localtime_r(&nowTimeT, &nowTm);
    std::ostringstream oss;
    oss << options_.historyLabel << ' ' << std::put_time(&nowTm, "%H:%M:%S");
    return oss.str();
}

auto PatchApplier::apply(Patch const& patch) -> Expected<PatchSet> {
    // Committed on scope exit, after the cycle guard below has ended the cycle.
    auto                     recording = History::HistoryTransaction::begin(history, historyLabel());
    IdentityMap::CycleGuard  cycle(identities);

    // Tracks any portions of the patch that could not be applied.
    PatchSet unapplied;

    // Ref properties are assigned only once every addition exists, so that
    // forward and cyclic references can be resolved.
    std::vector<DeferredRef> deferredRefs;

    applyRemovals(patch, unapplied);

    if (auto added = applyAdditions(patch, deferredRefs, unapplied); !added) {
        ts_log("Aborting patch: " + describeError(added.error()), "PatchApplier", "ERROR");
        return std::unexpected(added.error());
    }

    applyUpdates(patch, deferredRefs, unapplied);

    DeferredRefResolver::resolve(context, deferredRefs, unapplied);

    if (!unapplied.isEmpty()) {
        ts_log("Patch applied partially, unapplied: " + PatchJson::describePatch(unapplied), "PatchApplier", "DEBUG");
    }
    return unapplied;
}

void PatchApplier::applyRemovals(Patch const& patch, PatchSet& unapplied) {
    for (auto const& target : patch.removed) {
        auto removed = std::visit(
                [&](auto const& entry) -> Expected<void> {
                    using T = std::decay_t<decltype(entry)>;
                    if constexpr (std::is_same_v<T, Id>) {
                        return identities.destroyId(entry);
                    } else {
                        return identities.destroyObject(entry);
                    }
                },
                target);
        if (!removed) {
            ts_log("Could not remove: " + describeError(removed.error()), "PatchApplier", "DEBUG");
            unapplied.removed.push_back(target);
        }
    }
}

auto PatchApplier::applyAdditions(Patch const& patch, std::vector<DeferredRef>& deferredRefs, PatchSet& unapplied)
        -> Expected<void> {
    phmap::flat_hash_set<Id> reifiedRoots;

    // A node whose added parent does not list it as a child only becomes
    // reachable once that parent exists, so passes repeat until one builds
    // nothing new.
    bool progressed = true;
    while (progressed) {
        progressed = false;
        for (auto const& [addedId, addedInstance] : patch.added) {
            // Already created as part of an earlier subtree, or not new at all.
            if (identities.byId(addedId)) {
                continue;
            }
            // Failed along with an ancestor that could not be created.
            if (unapplied.added.contains(addedId)) {
                continue;
            }

            // Walk up to the topmost ancestor that is also being added, so each
            // subtree is reified once and from the top.
            Id                     rootId   = addedId;
            VirtualInstance const* instance = &addedInstance;
            std::size_t            steps    = 0;
            while (instance->parent) {
                auto parentIt = patch.added.find(*instance->parent);
                if (parentIt == patch.added.end() || identities.byId(parentIt->first)) {
                    break;
                }
                if (++steps > patch.added.size()) {
                    return std::unexpected(Error{Error::Code::MalformedPatch,
                                                 "Parent chain of '" + addedId + "' forms a cycle"});
                }
                rootId   = parentIt->first;
                instance = &parentIt->second;
            }

            if (!reifiedRoots.insert(rootId).second) {
                // This subtree was attempted already; its failures are recorded.
                continue;
            }

            std::optional<ObjectHandle> parentObject;
            if (instance->parent) {
                parentObject = identities.byId(*instance->parent);
            }
            if (!parentObject || !tree.exists(*parentObject)) {
                return std::unexpected(Error{Error::Code::MalformedPatch,
                                             "Cannot add an instance from a patch that has no parent. Instance '"
                                                     + rootId + "' with parent '"
                                                     + instance->parent.value_or("<none>") + "'"});
            }

            auto failed = reifier.reifyInstance(deferredRefs, patch.added, rootId, *parentObject);
            if (!failed) {
                return std::unexpected(failed.error());
            }
            progressed = true;
            if (!failed->isEmpty()) {
                ts_log("Failed to reify as part of applying a patch: " + PatchJson::describePatch(*failed),
                       "PatchApplier",
                       "DEBUG");
                unapplied.assign(*failed);
            }
        }
    }

    // Still unbuilt: an undeclared child of an added parent that failed to create.
    for (auto const& [addedId, addedInstance] : patch.added) {
        if (identities.byId(addedId) || unapplied.added.contains(addedId)) {
            continue;
        }
        ts_log("'" + addedId + "' is not a declared child of '" + addedInstance.parent.value_or("<none>") + "'",
               "PatchApplier",
               "DEBUG");
        unapplied.added.emplace(addedId, addedInstance);
    }
    return {};
}

void PatchApplier::applyUpdates(Patch const& patch, std::vector<DeferredRef>& deferredRefs, PatchSet& unapplied) {
    for (auto const& update : patch.updated) {
        auto object = identities.byId(update.id);
        if (!object || !tree.exists(*object)) {
            // We can't update an object that doesn't exist.
            recordVerbatim(unapplied, update);
            continue;
        }

        // Keep a two-way watcher from picking up our own writes.
        identities.suppress(*object);

        if (update.changedClassName) {
            applyClassChange(update, *object, deferredRefs, unapplied);
            continue;
        }

        Update failed{.id = update.id};

        if (update.changedName) {
            if (auto renamed = tree.setName(*object, *update.changedName); !renamed) {
                failed.changedName = update.changedName;
            }
        }

        // Metadata is never applied to the live tree.
        if (update.changedMetadata) {
            failed.changedMetadata = update.changedMetadata;
        }

        if (!update.changedProperties.empty()) {
            failed.changedProperties =
                    applyProperties(context, update.id, *object, update.changedProperties, deferredRefs);
        }

        if (!failed.isEmpty()) {
            mergeUpdate(unapplied.updateFor(update.id), failed);
        }
    }
}

void PatchApplier::applyClassChange(Update const&             update,
                                    ObjectHandle              original,
                                    std::vector<DeferredRef>& deferredRefs,
                                    PatchSet&                 unapplied) {
    auto currentName   = tree.name(original);
    auto currentParent = tree.parent(original);
    if (!currentName || !currentParent || !*currentParent) {
        recordVerbatim(unapplied, update);
        return;
    }
    auto const newName = update.changedName.value_or(*currentName);

    // Only the properties named by this update are carried to the new object.
    std::map<Id, VirtualInstance> replacement;
    replacement.emplace(update.id,
                        VirtualInstance{.className  = *update.changedClassName,
                                        .name       = newName,
                                        .parent     = std::nullopt,
                                        .properties = update.changedProperties,
                                        .children   = {}});

    std::vector<DeferredRef> rebuiltRefs;
    auto failed = reifier.reifyInstance(rebuiltRefs, replacement, update.id, **currentParent, Reifier::Mode::Rebind);
    if (!failed) {
        ts_log("Rebuild of '" + update.id + "' failed: " + describeError(failed.error()), "PatchApplier", "ERROR");
        recordVerbatim(unapplied, update);
        return;
    }

    auto rebuilt = identities.byId(update.id);
    if (!rebuilt || *rebuilt == original) {
        recordVerbatim(unapplied, update);
        return;
    }
    if (auto rebuiltName = tree.name(*rebuilt); !rebuiltName || *rebuiltName != newName) {
        rollBackRebuild(update.id, original, *rebuilt, {});
        recordVerbatim(unapplied, update);
        return;
    }

    auto children = tree.children(original);
    if (!children) {
        rollBackRebuild(update.id, original, *rebuilt, {});
        recordVerbatim(unapplied, update);
        return;
    }

    // All children move, or none do.
    std::vector<ObjectHandle> moved;
    moved.reserve(children->size());
    for (auto child : *children) {
        identities.suppress(child);
        if (auto reparented = tree.setParent(child, *rebuilt); !reparented) {
            ts_log("Could not move child " + describeHandle(child) + " of '" + update.id
                           + "': " + describeError(reparented.error()),
                   "PatchApplier",
                   "DEBUG");
            rollBackRebuild(update.id, original, *rebuilt, moved);
            recordVerbatim(unapplied, update);
            return;
        }
        moved.push_back(child);
    }

    // The original is detached, not destroyed; undo restores it.
    if (auto detached = tree.setParent(original, std::nullopt); !detached) {
        rollBackRebuild(update.id, original, *rebuilt, moved);
        recordVerbatim(unapplied, update);
        return;
    }

    if (!failed->isEmpty()) {
        unapplied.assign(*failed);
    }
    deferredRefs.insert(deferredRefs.end(),
                        std::make_move_iterator(rebuiltRefs.begin()),
                        std::make_move_iterator(rebuiltRefs.end()));
}

void PatchApplier::rollBackRebuild(Id const&                        id,
                                   ObjectHandle                     original,
                                   ObjectHandle                     rebuilt,
                                   std::vector<ObjectHandle> const& movedChildren) {
    // Children still under the replacement must not be destroyed with it.
    bool keepRebuilt = false;
    for (auto child : movedChildren) {
        auto restored = tree.setParent(child, original);
        if (restored) {
            continue;
        }
        ts_log("Could not return child " + describeHandle(child) + " to '" + id
                       + "': " + describeError(restored.error()),
               "PatchApplier",
               "ERROR");
        if (auto detached = tree.setParent(child, std::nullopt); !detached) {
            ts_log("Could not detach child " + describeHandle(child) + " from the replacement of '" + id
                           + "': " + describeError(detached.error()),
                   "PatchApplier",
                   "ERROR");
            keepRebuilt = true;
        }
    }
    if (auto repointed = identities.repoint(id, original); !repointed) {
        ts_log("Could not rebind '" + id + "': " + describeError(repointed.error()), "PatchApplier", "ERROR");
    }
    if (keepRebuilt) {
        return;
    }
    if (auto destroyed = identities.destroyObject(rebuilt); !destroyed) {
        ts_log("Could not destroy replacement of '" + id + "': " + describeError(destroyed.error()),
               "PatchApplier",
               "ERROR");
    }
}

} // namespace TS
