#include "history/HistoryRecorder.hpp"

#include "log/TaggedLogger.hpp"

#include <utility>

namespace TS::History {

HistoryTransaction::HistoryTransaction(HistoryRecorder& recorder, RecordingHandle handle)
    : recorder_(&recorder)
    , handle_(handle) {}

HistoryTransaction::HistoryTransaction(HistoryTransaction&& other) noexcept
    : recorder_(std::exchange(other.recorder_, nullptr))
    , handle_(std::exchange(other.handle_, std::nullopt)) {}

HistoryTransaction& HistoryTransaction::operator=(HistoryTransaction&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    if (auto result = commit(); !result) {
        ts_log("HistoryTransaction commit on reassignment failed: " + describeError(result.error()), "History", "ERROR");
    }
    recorder_ = std::exchange(other.recorder_, nullptr);
    handle_   = std::exchange(other.handle_, std::nullopt);
    return *this;
}

HistoryTransaction::~HistoryTransaction() {
    if (auto result = commit(); !result) {
        ts_log("HistoryTransaction commit on scope exit failed: " + describeError(result.error()), "History", "ERROR");
    }
}

auto HistoryTransaction::begin(HistoryRecorder* recorder, std::string_view label) -> HistoryTransaction {
    if (!recorder) {
        return {};
    }
    auto handle = recorder->tryBegin(label);
    if (!handle) {
        // There can only be one recording at a time
        ts_log("Failed to begin history recording for " + std::string{label} + ". Another recording is in progress.",
               "History",
               "DEBUG");
        return {};
    }
    return HistoryTransaction(*recorder, *handle);
}

auto HistoryTransaction::commit() -> Expected<void> {
    if (!handle_ || !recorder_) {
        handle_.reset();
        return {};
    }
    auto handle = *handle_;
    handle_.reset();
    return recorder_->finish(handle, true);
}

} // namespace TS::History
