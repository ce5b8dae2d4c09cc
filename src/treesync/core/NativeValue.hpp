#pragma once

#include "core/Id.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace TS {

struct NativeValue;

/**
 * Host-side representation of an enum member. The numeric value is the one
 * the schema assigns; the names are kept so a value can be echoed back.
 */
struct EnumItem {
    std::string   enumName;
    std::string   itemName;
    std::uint32_t value = 0;

    friend bool operator==(EnumItem const&, EnumItem const&) = default;
};

// Structured group of native values written in one bulk call.
struct NativeTable {
    std::map<std::string, NativeValue> entries;

    friend bool operator==(NativeTable const&, NativeTable const&) = default;
};

/**
 * A decoded property value as the host tree stores it.
 *
 * Kinds:
 * - Nil: the absence of a value (also a cleared object reference)
 * - Bool, Int64, Float64, String: scalars
 * - Vector: fixed-size numeric tuples (Vector2, Vector3, Color3, ...)
 * - Enum: a resolved enum member
 * - Object: a reference to another live object
 * - Table: a structured group (StyledProperties, attribute bags)
 */
struct NativeValue {
    enum class Kind {
        Nil = 0,
        Bool,
        Int64,
        Float64,
        String,
        Vector,
        Enum,
        Object,
        Table
    };

    using Storage = std::variant<std::monostate,
                                 bool,
                                 std::int64_t,
                                 double,
                                 std::string,
                                 std::vector<double>,
                                 EnumItem,
                                 ObjectHandle,
                                 NativeTable>;

    NativeValue() = default;
    NativeValue(bool v) : storage(v) {}
    NativeValue(std::int64_t v) : storage(v) {}
    NativeValue(int v) : storage(static_cast<std::int64_t>(v)) {}
    NativeValue(double v) : storage(v) {}
    NativeValue(std::string v) : storage(std::move(v)) {}
    NativeValue(char const* v) : storage(std::string{v}) {}
    NativeValue(std::vector<double> v) : storage(std::move(v)) {}
    NativeValue(EnumItem v) : storage(std::move(v)) {}
    NativeValue(ObjectHandle v) : storage(v) {}
    NativeValue(NativeTable v) : storage(std::move(v)) {}

    [[nodiscard]] auto kind() const noexcept -> Kind { return static_cast<Kind>(storage.index()); }
    [[nodiscard]] bool isNil() const noexcept { return kind() == Kind::Nil; }

    template <typename T>
    [[nodiscard]] auto get() const -> T const* {
        return std::get_if<T>(&storage);
    }

    template <typename T>
    [[nodiscard]] auto get() -> T* {
        return std::get_if<T>(&storage);
    }

    friend bool operator==(NativeValue const&, NativeValue const&) = default;

    Storage storage;
};

[[nodiscard]] auto nativeKindName(NativeValue::Kind kind) -> std::string_view;
[[nodiscard]] auto describeNativeValue(NativeValue const& value) -> std::string;

} // namespace TS
