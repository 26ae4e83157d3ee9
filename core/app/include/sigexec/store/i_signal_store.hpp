#pragma once

#include "sigexec/domain/signal.hpp"
#include "sigexec/domain/signal_status.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sigexec {

// -----------------------------------------------------------------------------
// ISignalStore — gateway to the shared signal queue
// -----------------------------------------------------------------------------
//
// @brief  Read pending signals, write back their status. No business logic.
//
// @details
// The Coordinator holds an ISignalStore& so tests can substitute a store
// that fails on demand. The production implementation is SqliteSignalStore.
//
// Error reporting:
//   Neither method throws for per-call failures. fetchPending() returns
//   std::nullopt when the read itself failed (an empty vector means "read
//   fine, nothing pending"); setStatus() returns false. Failures are logged
//   by the implementation; the caller decides what to do next. Nothing is
//   retried here.
//
// Thread model: called only from the tick loop.
// -----------------------------------------------------------------------------
class ISignalStore {
 public:
  virtual ~ISignalStore() = default;

  // -------------------------------------------------------------------------
  // fetchPending(whitelist)
  // -------------------------------------------------------------------------
  // @brief  All PROCESS / MODIFY rows whose symbol is in the whitelist,
  //         ordered by id ascending.
  //
  // @param  whitelist  Symbols to accept. Compared case-insensitively.
  //
  // @return The rows, oldest first; std::nullopt if the query failed.
  //
  // @details
  // Rows whose direction cannot be resolved, or whose required prices are
  // NULL, are dropped silently — they are the producer's problem.
  // Read-only.
  // -------------------------------------------------------------------------
  virtual std::optional<std::vector<domain::Signal>> fetchPending(
      const std::vector<std::string>& whitelist) = 0;

  // -------------------------------------------------------------------------
  // setStatus(id, status)
  // -------------------------------------------------------------------------
  // @brief  Atomically sets status and updated_at on one row.
  //
  // @return true if the write committed (including the case where the row had
  //         already left PROCESS / MODIFY and nothing changed); false if the
  //         write failed or the status is one the core may not write.
  // -------------------------------------------------------------------------
  virtual bool setStatus(domain::SignalId id, domain::SignalStatus status) = 0;
};

}  // namespace sigexec
