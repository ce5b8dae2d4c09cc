#pragma once

#include "core/Id.hpp"
#include "patch/PatchSet.hpp"
#include "patch/VirtualValue.hpp"

#include <string>
#include <vector>

namespace TS {

struct ReconcileContext;

// A reference-typed property set aside until every addition has materialized.
struct DeferredRef {
    Id           id;
    ObjectHandle object;
    std::string  propertyName;
    VirtualValue value;
    // Set for entries of the post-properties bag; failures are recorded back inside it.
    bool inPostBag = false;
};

namespace DeferredRefResolver {

/**
 * Writes every pending reference. Runs once per apply, after all additions,
 * because references may point forward or form cycles.
 *
 * An unbound target, or a failing write, records the original value under
 * `ref.id` in `unapplied.updated`, merged into any existing record for that
 * id (last write wins per property). Null references write Nil.
 */
void resolve(ReconcileContext& context, std::vector<DeferredRef> const& deferredRefs, PatchSet& unapplied);

} // namespace DeferredRefResolver
} // namespace TS
