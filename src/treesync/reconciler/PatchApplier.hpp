#pragma once

#include "core/Error.hpp"
#include "identity/IdentityMap.hpp"
#include "patch/PatchSet.hpp"
#include "reconciler/ApplyOptions.hpp"
#include "reconciler/DeferredRefs.hpp"
#include "reconciler/PropertyWriter.hpp"
#include "reconciler/ReconcileContext.hpp"
#include "reconciler/Reifier.hpp"

#include <string>
#include <vector>

namespace TS {

class LiveTree;
class PropertySchema;

namespace History {
class HistoryRecorder;
}

/**
 * Applies patches to a live tree and reports what could not be applied.
 *
 * Phases, in order:
 *  1. removals: destroy each target; failures are returned in `removed`
 *  2. additions: reify each pending subtree once, from its topmost added
 *     ancestor; failures are returned in `added` / `updated`
 *  3. updates: rename, rebuild on class change, write properties; only the
 *     failed pieces of each update are returned
 *  4. deferred references: resolve Ref properties set aside by 2 and 3
 *
 * The returned patch is empty exactly when everything applied. The only
 * fatal outcome is a malformed addition (no parent anywhere, a cycle in the
 * added parent chain, an id bound twice); apply() then returns an error.
 * Either way the history recording opened for the call is committed before
 * apply() returns, and the identity map's suppression cycle is ended.
 *
 * All collaborators are borrowed and must outlive the applier. `history` may
 * be null, in which case no undo grouping is recorded.
 */
class PatchApplier {
public:
    PatchApplier(LiveTree&                  tree,
                 PropertySchema const&      schema,
                 IdentityMap&               identities,
                 History::HistoryRecorder*  history,
                 ApplyOptions               options = {});

    PatchApplier(PatchApplier const&)            = delete;
    PatchApplier& operator=(PatchApplier const&) = delete;

    [[nodiscard]] auto apply(Patch const& patch) -> Expected<PatchSet>;

    [[nodiscard]] auto options() const noexcept -> ApplyOptions const& { return options_; }

private:
    void applyRemovals(Patch const& patch, PatchSet& unapplied);
    auto applyAdditions(Patch const& patch, std::vector<DeferredRef>& deferredRefs, PatchSet& unapplied)
            -> Expected<void>;
    void applyUpdates(Patch const& patch, std::vector<DeferredRef>& deferredRefs, PatchSet& unapplied);
    void applyClassChange(Update const&              update,
                          ObjectHandle               original,
                          std::vector<DeferredRef>&  deferredRefs,
                          PatchSet&                  unapplied);
    void rollBackRebuild(Id const&                        id,
                         ObjectHandle                     original,
                         ObjectHandle                     rebuilt,
                         std::vector<ObjectHandle> const& movedChildren);

    auto historyLabel() const -> std::string;

    LiveTree&                 tree;
    PropertySchema const&     schema;
    IdentityMap&              identities;
    History::HistoryRecorder* history;
    ApplyOptions              options_;
    PropertyWriter            writer;
    ReconcileContext          context;
    Reifier                   reifier;
};

} // namespace TS
