#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace TS {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NotFound,
        UnknownId,
        UnknownObject,
        AlreadyBound,
        InvalidValue,
        TypeMismatch,
        UnwritableProperty,
        LackingPropertyPermissions,
        OtherPropertyError,
        CreateFailed,
        DestroyFailed,
        ReparentFailed,
        RenameFailed,
        MalformedPatch,
        MalformedInput,
        NotSupported
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::UnknownId:
        return "unknown_id";
    case Error::Code::UnknownObject:
        return "unknown_object";
    case Error::Code::AlreadyBound:
        return "already_bound";
    case Error::Code::InvalidValue:
        return "invalid_value";
    case Error::Code::TypeMismatch:
        return "type_mismatch";
    case Error::Code::UnwritableProperty:
        return "unwritable_property";
    case Error::Code::LackingPropertyPermissions:
        return "lacking_property_permissions";
    case Error::Code::OtherPropertyError:
        return "other_property_error";
    case Error::Code::CreateFailed:
        return "create_failed";
    case Error::Code::DestroyFailed:
        return "destroy_failed";
    case Error::Code::ReparentFailed:
        return "reparent_failed";
    case Error::Code::RenameFailed:
        return "rename_failed";
    case Error::Code::MalformedPatch:
        return "malformed_patch";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::NotSupported:
        return "not_supported";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace TS
