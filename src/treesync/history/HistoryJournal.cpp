#include "history/HistoryJournal.hpp"

namespace TS::History {

auto HistoryJournal::tryBegin(std::string_view label) -> std::optional<RecordingHandle> {
    if (open_) {
        return std::nullopt;
    }
    open_ = OpenRecording{RecordingHandle{nextHandle_++}, std::string{label}};
    return open_->handle;
}

auto HistoryJournal::finish(RecordingHandle handle, bool commit) -> Expected<void> {
    if (!open_ || open_->handle != handle) {
        return std::unexpected(Error{Error::Code::NotFound,
                                     "No open history recording " + std::to_string(handle.value)});
    }
    entries_.push_back(Entry{std::move(open_->label), commit});
    open_.reset();
    return {};
}

} // namespace TS::History
