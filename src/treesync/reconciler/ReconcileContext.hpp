#pragma once

#include "reconciler/ApplyOptions.hpp"

namespace TS {

class IdentityMap;
class LiveTree;
class PropertySchema;
class PropertyWriter;

// Collaborators shared by every stage of one PatchApplier.
struct ReconcileContext {
    LiveTree&             tree;
    PropertySchema const& schema;
    IdentityMap&          identities;
    PropertyWriter&       writer;
    ApplyOptions const&   options;
};

} // namespace TS
