#pragma once

#include "sigexec/domain/side.hpp"
#include "sigexec/domain/signal_status.hpp"

#include <optional>
#include <string>

namespace sigexec {

// -----------------------------------------------------------------------------
// Status / direction text codec
// -----------------------------------------------------------------------------
//
// @brief  The only mapping between the enums the core works with and the
//         text the shared database stores.
//
// @details
// Status text is the producer's exact vocabulary (upper case, six values);
// parsing is case-insensitive so a hand-edited row still round-trips.
//
// Direction text is whatever the producer wrote. BUY / LONG and SELL / SHORT
// are accepted in any case with surrounding whitespace ignored. Anything else
// yields std::nullopt and the store drops the row.
//
// Used by SqliteSignalStore and by the IPC telemetry formatter. Business
// logic never compares status strings.
// -----------------------------------------------------------------------------

const char* statusToText(domain::SignalStatus status);

std::optional<domain::SignalStatus> parseStatus(const std::string& text);

std::optional<domain::Side> parseDirection(const std::string& text);

}  // namespace sigexec
