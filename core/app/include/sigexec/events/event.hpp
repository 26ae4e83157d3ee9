#pragma once

#include "event_types.hpp"

#include <variant>

namespace sigexec {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope for everything the engine reports.
//
// A closed std::variant keeps events as plain values (no heap allocation, no
// base-class pointers) and lets subscribers dispatch with std::get_if or
// std::visit. Adding an event type means adding it here; every exhaustive
// std::visit then fails to compile until it handles the new type.
// -----------------------------------------------------------------------------
using Event = std::variant<
    SignalStatusEvent,
    RiskLockEvent,
    SessionResetEvent,
    BreakevenEvent,
    TickSummaryEvent>;

}  // namespace sigexec
