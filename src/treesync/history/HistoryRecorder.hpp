#pragma once

#include "core/Error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace TS::History {

struct RecordingHandle {
    std::uint64_t value = 0;

    friend bool operator==(RecordingHandle, RecordingHandle) = default;
};

/**
 * Host undo/redo history service.
 *
 * tryBegin() is best-effort: it returns nullopt when a recording cannot be
 * started (for example because another one is already open). finish() closes
 * a recording opened by tryBegin(), committing or cancelling it.
 */
class HistoryRecorder {
public:
    virtual ~HistoryRecorder() = default;

    virtual auto tryBegin(std::string_view label) -> std::optional<RecordingHandle> = 0;
    virtual auto finish(RecordingHandle handle, bool commit) -> Expected<void>     = 0;
};

/**
 * Scoped recording. A transaction that was never explicitly committed is
 * committed by the destructor, so every exit path closes the recording.
 * A transaction without a recorder, or whose begin failed, is inert.
 */
class HistoryTransaction {
public:
    HistoryTransaction() = default;
    HistoryTransaction(HistoryTransaction&& other) noexcept;
    HistoryTransaction& operator=(HistoryTransaction&& other) noexcept;
    ~HistoryTransaction();

    HistoryTransaction(HistoryTransaction const&)            = delete;
    HistoryTransaction& operator=(HistoryTransaction const&) = delete;

    [[nodiscard]] static auto begin(HistoryRecorder* recorder, std::string_view label) -> HistoryTransaction;

    auto commit() -> Expected<void>;
    explicit operator bool() const noexcept { return handle_.has_value(); }

private:
    HistoryTransaction(HistoryRecorder& recorder, RecordingHandle handle);

    HistoryRecorder*               recorder_ = nullptr;
    std::optional<RecordingHandle> handle_;
};

} // namespace TS::History
