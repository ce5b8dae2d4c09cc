#pragma once

#include "core/Error.hpp"
#include "core/NativeValue.hpp"
#include "patch/VirtualValue.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace TS {

class IdentityMap;
class PropertySchema;

namespace PropertyCodec {

/**
 * Decodes a virtual value into the native value the host stores.
 *
 * Primitive types:
 *   Bool                               raw bool
 *   Int32, Int64                       raw integer
 *   Float32, Float64                   raw number
 *   String, Content, Tag               raw string
 *   Vector2, UDim                      [x, y]
 *   Vector3, Color3                    [x, y, z]
 *   UDim2, Rect                        [a, b, c, d]
 *   CFrame                             12 numbers (position, then rotation matrix)
 *   Enum                               raw unsigned integer, or "Enum.<Name>.<Item>"
 *
 * Ref values resolve immediately against `identities`: a null reference
 * decodes to Nil and an unbound target is an UnknownId error. Callers that
 * need to wait for a target to be created must set Ref values aside before
 * calling decode(). Composite values decode entry by entry into a NativeTable;
 * the first failing entry fails the whole composite.
 */
[[nodiscard]] auto decode(VirtualValue const& value, IdentityMap const& identities, PropertySchema const& schema)
        -> Expected<NativeValue>;

struct EnumPath {
    std::string_view enumName;
    std::string_view itemName;
};

// Splits a string of the exact shape "Enum.<EnumName>.<Item>".
[[nodiscard]] auto splitEnumPath(std::string_view text) -> std::optional<EnumPath>;

// Number of components a tuple type carries, or nullopt for non-tuple types.
[[nodiscard]] auto tupleArity(std::string_view type) -> std::optional<std::size_t>;

} // namespace PropertyCodec
} // namespace TS
