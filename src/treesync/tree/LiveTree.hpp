#pragma once

#include "core/Error.hpp"
#include "core/Id.hpp"
#include "core/NativeValue.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

/**
 * LiveTree is the host object graph the engine reconciles against.
 *
 * The engine never owns live objects; it only refers to them by ObjectHandle
 * and mutates them through these primitives. Every mutation reports failure
 * through Expected so the caller can turn it into an unapplied patch entry.
 *
 * Contract:
 * - create() returns a new object of the given class parented under `parent`.
 * - setParent(object, std::nullopt) detaches without destroying; a detached
 *   object keeps its identity, children and properties.
 * - destroy() removes the object and its whole subtree.
 * - children() preserves insertion order.
 * - setProperty() is the raw write used by schema descriptors; setProperties()
 *   is the bulk structured write used for styled property groups.
 */
class LiveTree {
public:
    virtual ~LiveTree() = default;

    [[nodiscard]] virtual auto root() const -> ObjectHandle = 0;
    [[nodiscard]] virtual bool exists(ObjectHandle object) const = 0;

    virtual auto create(std::string_view className, ObjectHandle parent) -> Expected<ObjectHandle> = 0;
    virtual auto destroy(ObjectHandle object) -> Expected<void>                                     = 0;
    virtual auto setParent(ObjectHandle object, std::optional<ObjectHandle> parent) -> Expected<void> = 0;
    virtual auto setName(ObjectHandle object, std::string_view name) -> Expected<void>              = 0;

    [[nodiscard]] virtual auto className(ObjectHandle object) const -> Expected<std::string>            = 0;
    [[nodiscard]] virtual auto name(ObjectHandle object) const -> Expected<std::string>                 = 0;
    [[nodiscard]] virtual auto parent(ObjectHandle object) const -> Expected<std::optional<ObjectHandle>> = 0;
    [[nodiscard]] virtual auto children(ObjectHandle object) const -> Expected<std::vector<ObjectHandle>> = 0;

    virtual auto setProperty(ObjectHandle object, std::string_view property, NativeValue value) -> Expected<void> = 0;
    virtual auto setProperties(ObjectHandle object, NativeTable values) -> Expected<void>                        = 0;
    [[nodiscard]] virtual auto getProperty(ObjectHandle object, std::string_view property) const
            -> Expected<NativeValue> = 0;
};

} // namespace TS
