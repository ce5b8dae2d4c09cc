#pragma once

#include "core/Error.hpp"
#include "core/Id.hpp"
#include "patch/PatchSet.hpp"
#include "reconciler/DeferredRefs.hpp"

#include <map>
#include <vector>

namespace TS {

struct ReconcileContext;

/**
 * Materializes virtual subtrees into live objects.
 *
 * Construction is depth-first: the object is created under its parent,
 * named, bound in the identity map and given its properties before any of
 * its children are built. Ref properties go to `deferredRefs`. Property and
 * creation failures are collected into the returned patch; a node whose
 * object cannot be created is returned in `added` together with all of its
 * declared descendants.
 *
 * A missing parent object, a declared child absent from `added`, or an id
 * already bound to another object means the patch is malformed; these are
 * returned as errors and abort construction.
 */
class Reifier {
public:
    enum class Mode {
        // Bind new ids; binding an id twice is an error.
        Add,
        // Repoint an existing id to the newly created object (class rebuild).
        Rebind
    };

    explicit Reifier(ReconcileContext& context) : context(context) {}

    [[nodiscard]] auto reifyInstance(std::vector<DeferredRef>&            deferredRefs,
                                     std::map<Id, VirtualInstance> const& added,
                                     Id const&                            rootId,
                                     ObjectHandle                         parent,
                                     Mode                                 mode = Mode::Add) -> Expected<PatchSet>;

private:
    auto reifyInner(PatchSet&                            failures,
                    std::vector<DeferredRef>&            deferredRefs,
                    std::map<Id, VirtualInstance> const& added,
                    Id const&                            id,
                    ObjectHandle                         parent,
                    Mode                                 mode) -> Expected<void>;

    ReconcileContext& context;
};

} // namespace TS
