#pragma once

#include "core/Id.hpp"
#include "patch/VirtualValue.hpp"
#include "reconciler/DeferredRefs.hpp"

#include <vector>

namespace TS {

struct ReconcileContext;

/**
 * Applies a set of declared properties to one live object.
 *
 * Ref values are appended to `deferredRefs`. The post-properties entry (see
 * ApplyOptions) is held back and its bag applied after everything else.
 * Every other value is decoded and written; each value that fails is
 * returned under its original key, with failed bag entries nested back
 * under the post-properties key so the result can be re-applied as is.
 */
[[nodiscard]] auto applyProperties(ReconcileContext&         context,
                                   Id const&                 id,
                                   ObjectHandle              object,
                                   PropertyMap const&        properties,
                                   std::vector<DeferredRef>& deferredRefs) -> PropertyMap;

} // namespace TS
