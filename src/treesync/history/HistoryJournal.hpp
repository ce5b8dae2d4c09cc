#pragma once

#include "history/HistoryRecorder.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace TS::History {

/**
 * In-memory HistoryRecorder. Only one recording may be open at a time;
 * finished recordings are kept in order with their outcome.
 */
class HistoryJournal final : public HistoryRecorder {
public:
    struct Entry {
        std::string label;
        bool        committed = false;
    };

    auto tryBegin(std::string_view label) -> std::optional<RecordingHandle> override;
    auto finish(RecordingHandle handle, bool commit) -> Expected<void> override;

    [[nodiscard]] bool recording() const noexcept { return open_.has_value(); }
    [[nodiscard]] auto entries() const noexcept -> std::vector<Entry> const& { return entries_; }

private:
    struct OpenRecording {
        RecordingHandle handle;
        std::string     label;
    };

    std::optional<OpenRecording> open_;
    std::vector<Entry>           entries_;
    std::uint64_t                nextHandle_ = 1;
};

} // namespace TS::History
