#pragma once

#include "core/Error.hpp"
#include "core/Id.hpp"
#include "core/NativeValue.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace TS {

enum class Scriptability {
    None,
    Read,
    Write,
    ReadWrite
};

[[nodiscard]] inline bool isWritable(Scriptability scriptability) noexcept {
    return scriptability == Scriptability::Write || scriptability == Scriptability::ReadWrite;
}

[[nodiscard]] auto scriptabilityName(Scriptability scriptability) -> std::string_view;
[[nodiscard]] auto parseScriptability(std::string_view text) -> std::optional<Scriptability>;

/**
 * Failure reported by a descriptor write.
 *
 * Hosts that can classify their failures report PermissionDenied directly.
 * Hosts that only have an opaque message report Host and the message in
 * `detail`; the writer then falls back to matching LackingPermissionText.
 */
struct DescriptorWriteFailure {
    enum class Kind {
        PermissionDenied,
        Host,
        Unknown
    };

    static constexpr std::string_view LackingPermissionText = "lacking permission";

    Kind        kind = Kind::Unknown;
    std::string detail;
};

class PropertyDescriptor {
public:
    virtual ~PropertyDescriptor() = default;

    [[nodiscard]] virtual auto scriptability() const -> Scriptability = 0;
    virtual auto write(ObjectHandle object, NativeValue const& value) const
            -> std::expected<void, DescriptorWriteFailure> = 0;
};

/**
 * Per-class, per-property write capability and enum lookup.
 *
 * findDescriptor() returns nullptr when the property is not reflected to the
 * live model; callers treat that as a silent no-op. Returned descriptors stay
 * valid for the lifetime of the schema.
 */
class PropertySchema {
public:
    virtual ~PropertySchema() = default;

    [[nodiscard]] virtual auto findDescriptor(std::string_view className, std::string_view propertyName) const
            -> PropertyDescriptor const* = 0;

    [[nodiscard]] virtual auto findEnumItem(std::string_view enumName, std::string_view itemName) const
            -> std::optional<EnumItem> = 0;
};

} // namespace TS
