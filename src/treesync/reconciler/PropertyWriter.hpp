#pragma once

#include "core/Error.hpp"
#include "core/Id.hpp"
#include "core/NativeValue.hpp"
#include "reconciler/ApplyOptions.hpp"

#include <string_view>

namespace TS {

class LiveTree;
class PropertySchema;

/**
 * Writes decoded values to live objects through the property schema.
 *
 * Policy:
 * - no descriptor for (class, property): success, nothing written
 * - descriptor not writable: UnwritableProperty
 * - write rejected for lack of permission: LackingPropertyPermissions
 * - write rejected for any other reason: OtherPropertyError
 *
 * Failures carry "<Class>.<Property>" as their message.
 *
 * The styled properties group bypasses the schema: its table is written in
 * one bulk call after "Enum.<Name>.<Item>" strings are resolved, and always
 * reports success.
 */
class PropertyWriter {
public:
    PropertyWriter(LiveTree& tree, PropertySchema const& schema, ApplyOptions const& options);

    auto write(ObjectHandle object, std::string_view propertyName, NativeValue const& value) const -> Expected<void>;

private:
    auto writeStyledProperties(ObjectHandle object, NativeValue const& value) const -> Expected<void>;

    LiveTree&             tree;
    PropertySchema const& schema;
    ApplyOptions const&   options;
};

} // namespace TS
