#pragma once

#include "core/Id.hpp"

#include <string>

namespace TS {

/**
 * ChangeSink is a minimal interface that abstracts change-notification delivery
 * from a host tree to whoever mirrors it (the two-way sync watcher).
 *
 * Typical usage:
 * - A LiveTree implementation holds registered sinks and calls notify() after
 *   every successful mutation, synchronously, on the mutating thread.
 * - A watcher that forwards host edits upstream consults the IdentityMap and
 *   skips objects that are suppressed for the current apply cycle, so the
 *   engine's own writes are not echoed back.
 */
struct ChangeSink {
    virtual ~ChangeSink() = default;

    // `what` is a property name, or one of "Name", "Parent", "Children", "Destroyed".
    virtual void notify(ObjectHandle object, std::string const& what) = 0;
};

} // namespace TS
