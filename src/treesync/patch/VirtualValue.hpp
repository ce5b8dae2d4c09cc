#pragma once

#include "core/Id.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace TS {

struct VirtualValue;

using PropertyMap = std::map<std::string, VirtualValue>;

/**
 * Desired value of one property, as described by the declarative source.
 *
 * - Primitive: a typed scalar or tuple, `raw` holding its encoded payload
 *   (e.g. type "Vector3", raw [1, 2, 3]). Decoding depends on `type`.
 * - Ref: a reference to another node by id. An empty target is the null
 *   reference. References are resolved against the identity map, never
 *   decoded structurally.
 * - Composite: a structured group of named values (styled properties,
 *   attribute bags).
 */
struct VirtualValue {
    struct Primitive {
        std::string    type;
        nlohmann::json raw;

        friend bool operator==(Primitive const&, Primitive const&) = default;
    };

    struct Ref {
        Id target;

        [[nodiscard]] bool isNull() const noexcept { return target.empty(); }

        friend bool operator==(Ref const&, Ref const&) = default;
    };

    struct Composite {
        std::map<std::string, VirtualValue> entries;

        friend bool operator==(Composite const&, Composite const&) = default;
    };

    using Storage = std::variant<Primitive, Ref, Composite>;

    Storage data;

    [[nodiscard]] static auto primitive(std::string type, nlohmann::json raw) -> VirtualValue {
        return VirtualValue{Primitive{std::move(type), std::move(raw)}};
    }
    [[nodiscard]] static auto ref(Id target) -> VirtualValue { return VirtualValue{Ref{std::move(target)}}; }
    [[nodiscard]] static auto nullRef() -> VirtualValue { return VirtualValue{Ref{}}; }
    [[nodiscard]] static auto composite(PropertyMap entries) -> VirtualValue {
        return VirtualValue{Composite{std::move(entries)}};
    }

    [[nodiscard]] bool isRef() const noexcept { return std::holds_alternative<Ref>(data); }
    [[nodiscard]] bool isComposite() const noexcept { return std::holds_alternative<Composite>(data); }

    [[nodiscard]] auto asRef() const -> Ref const* { return std::get_if<Ref>(&data); }
    [[nodiscard]] auto asPrimitive() const -> Primitive const* { return std::get_if<Primitive>(&data); }
    [[nodiscard]] auto asComposite() const -> Composite const* { return std::get_if<Composite>(&data); }

    friend bool operator==(VirtualValue const&, VirtualValue const&) = default;
};

// Convenience constructors for the common primitive types.
namespace Values {
[[nodiscard]] inline auto string(std::string value) -> VirtualValue {
    return VirtualValue::primitive("String", std::move(value));
}
[[nodiscard]] inline auto boolean(bool value) -> VirtualValue {
    return VirtualValue::primitive("Bool", value);
}
[[nodiscard]] inline auto int64(std::int64_t value) -> VirtualValue {
    return VirtualValue::primitive("Int64", value);
}
[[nodiscard]] inline auto float64(double value) -> VirtualValue {
    return VirtualValue::primitive("Float64", value);
}
} // namespace Values

} // namespace TS
