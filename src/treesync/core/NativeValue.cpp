#include "core/NativeValue.hpp"

#include <sstream>

namespace TS {

auto nativeKindName(NativeValue::Kind kind) -> std::string_view {
    switch (kind) {
    case NativeValue::Kind::Nil:
        return "Nil";
    case NativeValue::Kind::Bool:
        return "Bool";
    case NativeValue::Kind::Int64:
        return "Int64";
    case NativeValue::Kind::Float64:
        return "Float64";
    case NativeValue::Kind::String:
        return "String";
    case NativeValue::Kind::Vector:
        return "Vector";
    case NativeValue::Kind::Enum:
        return "Enum";
    case NativeValue::Kind::Object:
        return "Object";
    case NativeValue::Kind::Table:
        return "Table";
    }
    return "Unknown";
}

auto describeNativeValue(NativeValue const& value) -> std::string {
    std::ostringstream oss;
    std::visit(
            [&](auto const& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    oss << "nil";
                } else if constexpr (std::is_same_v<T, bool>) {
                    oss << (v ? "true" : "false");
                } else if constexpr (std::is_same_v<T, std::string>) {
                    oss << '"' << v << '"';
                } else if constexpr (std::is_same_v<T, std::vector<double>>) {
                    oss << '(';
                    for (std::size_t i = 0; i < v.size(); ++i) {
                        if (i > 0)
                            oss << ", ";
                        oss << v[i];
                    }
                    oss << ')';
                } else if constexpr (std::is_same_v<T, EnumItem>) {
                    oss << "Enum." << v.enumName << '.' << v.itemName;
                } else if constexpr (std::is_same_v<T, ObjectHandle>) {
                    oss << describeHandle(v);
                } else if constexpr (std::is_same_v<T, NativeTable>) {
                    oss << '{';
                    bool first = true;
                    for (auto const& [key, entry] : v.entries) {
                        if (!first)
                            oss << ", ";
                        first = false;
                        oss << key << " = " << describeNativeValue(entry);
                    }
                    oss << '}';
                } else {
                    oss << v;
                }
            },
            value.storage);
    return oss.str();
}

} // namespace TS
