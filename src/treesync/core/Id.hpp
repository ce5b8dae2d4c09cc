#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace TS {

// Stable identifier of a node for the lifetime of a sync session. Generated
// upstream and unrelated to the identity of the live object it is bound to.
using Id = std::string;

// Opaque identity of an object owned by the host tree. Zero is never issued.
struct ObjectHandle {
    std::uint64_t value = 0;

    constexpr ObjectHandle() = default;
    constexpr explicit ObjectHandle(std::uint64_t v) : value(v) {}

    [[nodiscard]] constexpr bool valid() const noexcept { return value != 0; }
    constexpr explicit operator bool() const noexcept { return valid(); }

    friend constexpr bool operator==(ObjectHandle, ObjectHandle) = default;
    friend constexpr auto operator<=>(ObjectHandle, ObjectHandle) = default;
};

[[nodiscard]] inline auto describeHandle(ObjectHandle handle) -> std::string {
    return "#" + std::to_string(handle.value);
}

} // namespace TS

template <>
struct std::hash<TS::ObjectHandle> {
    auto operator()(TS::ObjectHandle handle) const noexcept -> std::size_t {
        return std::hash<std::uint64_t>{}(handle.value);
    }
};
