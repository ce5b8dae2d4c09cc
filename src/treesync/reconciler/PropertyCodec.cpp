#include "reconciler/PropertyCodec.hpp"

#include "identity/IdentityMap.hpp"
#include "schema/PropertySchema.hpp"

#include <array>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace TS::PropertyCodec {

namespace {

auto mismatch(std::string const& type, nlohmann::json const& raw) -> Error {
    return Error{Error::Code::TypeMismatch,
                 "Value of type " + type + " cannot be decoded from JSON " + std::string{raw.type_name()}};
}

auto decodeEnum(VirtualValue::Primitive const& value, PropertySchema const& schema) -> Expected<NativeValue> {
    if (value.raw.is_number_unsigned()) {
        auto const raw = value.raw.get<std::uint64_t>();
        if (raw > std::numeric_limits<std::uint32_t>::max()) {
            return std::unexpected(Error{Error::Code::InvalidValue, "Enum value out of range"});
        }
        return NativeValue{EnumItem{{}, {}, static_cast<std::uint32_t>(raw)}};
    }
    if (value.raw.is_string()) {
        auto const text = value.raw.get<std::string>();
        auto const path = splitEnumPath(text);
        if (!path) {
            return std::unexpected(Error{Error::Code::InvalidValue, "'" + text + "' is not an enum path"});
        }
        if (auto item = schema.findEnumItem(path->enumName, path->itemName)) {
            return NativeValue{std::move(*item)};
        }
        return std::unexpected(Error{Error::Code::InvalidValue, "Unknown enum item '" + text + "'"});
    }
    return std::unexpected(mismatch(value.type, value.raw));
}

auto decodeTuple(VirtualValue::Primitive const& value, std::size_t arity) -> Expected<NativeValue> {
    if (!value.raw.is_array() || value.raw.size() != arity) {
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     value.type + " expects an array of " + std::to_string(arity) + " numbers"});
    }
    std::vector<double> components;
    components.reserve(arity);
    for (auto const& component : value.raw) {
        if (!component.is_number()) {
            return std::unexpected(mismatch(value.type, component));
        }
        components.push_back(component.get<double>());
    }
    return NativeValue{std::move(components)};
}

auto decodePrimitive(VirtualValue::Primitive const& value, PropertySchema const& schema) -> Expected<NativeValue> {
    auto const& type = value.type;
    auto const& raw  = value.raw;

    if (type == "Bool") {
        if (!raw.is_boolean())
            return std::unexpected(mismatch(type, raw));
        return NativeValue{raw.get<bool>()};
    }
    if (type == "Int32" || type == "Int64") {
        if (!raw.is_number_integer())
            return std::unexpected(mismatch(type, raw));
        if (raw.is_number_unsigned()
            && raw.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::unexpected(Error{Error::Code::InvalidValue, type + " value out of range"});
        }
        return NativeValue{raw.get<std::int64_t>()};
    }
    if (type == "Float32" || type == "Float64") {
        if (!raw.is_number())
            return std::unexpected(mismatch(type, raw));
        return NativeValue{raw.get<double>()};
    }
    if (type == "String" || type == "Content" || type == "Tag") {
        if (!raw.is_string())
            return std::unexpected(mismatch(type, raw));
        return NativeValue{raw.get<std::string>()};
    }
    if (type == "Enum") {
        return decodeEnum(value, schema);
    }
    if (auto arity = tupleArity(type)) {
        return decodeTuple(value, *arity);
    }
    return std::unexpected(Error{Error::Code::NotSupported, "Unsupported value type '" + type + "'"});
}

} // namespace

auto splitEnumPath(std::string_view text) -> std::optional<EnumPath> {
    constexpr std::string_view prefix = "Enum.";
    if (!text.starts_with(prefix)) {
        return std::nullopt;
    }
    auto const rest = text.substr(prefix.size());
    auto const dot  = rest.find('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == rest.size()) {
        return std::nullopt;
    }
    auto const item = rest.substr(dot + 1);
    if (item.find('.') != std::string_view::npos) {
        return std::nullopt;
    }
    return EnumPath{rest.substr(0, dot), item};
}

auto tupleArity(std::string_view type) -> std::optional<std::size_t> {
    constexpr std::array<std::pair<std::string_view, std::size_t>, 7> tuples{{
            {"Vector2", 2},
            {"UDim", 2},
            {"Vector3", 3},
            {"Color3", 3},
            {"UDim2", 4},
            {"Rect", 4},
            {"CFrame", 12},
    }};
    for (auto const& [name, arity] : tuples) {
        if (name == type) {
            return arity;
        }
    }
    return std::nullopt;
}

auto decode(VirtualValue const& value, IdentityMap const& identities, PropertySchema const& schema)
        -> Expected<NativeValue> {
    return std::visit(
            [&](auto const& alternative) -> Expected<NativeValue> {
                using T = std::decay_t<decltype(alternative)>;
                if constexpr (std::is_same_v<T, VirtualValue::Primitive>) {
                    return decodePrimitive(alternative, schema);
                } else if constexpr (std::is_same_v<T, VirtualValue::Ref>) {
                    if (alternative.isNull()) {
                        return NativeValue{};
                    }
                    if (auto object = identities.byId(alternative.target)) {
                        return NativeValue{*object};
                    }
                    return std::unexpected(Error{Error::Code::UnknownId,
                                                 "Reference target '" + alternative.target + "' is not bound"});
                } else {
                    NativeTable table;
                    for (auto const& [name, entry] : alternative.entries) {
                        auto decoded = decode(entry, identities, schema);
                        if (!decoded) {
                            return std::unexpected(decoded.error());
                        }
                        table.entries.emplace(name, std::move(*decoded));
                    }
                    return NativeValue{std::move(table)};
                }
            },
            value.data);
}

} // namespace TS::PropertyCodec
