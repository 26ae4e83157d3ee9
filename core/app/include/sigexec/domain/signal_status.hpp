#pragma once

namespace sigexec {
namespace domain {

// -----------------------------------------------------------------------------
// SignalStatus — lifecycle of one row in the shared signal queue
// -----------------------------------------------------------------------------
//
// @brief  Closed set of statuses a signal row can carry.
//
// @details
// Ownership of transitions is split between two writers:
//
//   producer:  (new row) ──> Process / Modify
//              Process / Modify ──> Expired        (its own timeout sweep)
//
//   this core: Process / Modify ──> Done           (both legs opened)
//              Process / Modify ──> Invalid        (failed validation)
//              Process / Modify ──> Error          (execution failed)
//
// Terminal states: Done, Invalid, Expired. Error is final for the core (it is
// never retried automatically) but a human or the producer may resubmit.
//
// The enum never leaves the process as an integer. The text form stored in
// the database ("PROCESS", "DONE", ...) is produced and parsed exclusively in
// store/status_codec.hpp.
// -----------------------------------------------------------------------------
enum class SignalStatus {
  Process,  // New signal waiting to be executed
  Modify,   // Producer updated the prices of an existing signal
  Done,     // Dual position opened — terminal
  Invalid,  // Rejected by validation — terminal
  Error,    // Execution failed and was rolled back
  Expired,  // Producer timed the signal out — terminal, never written here
};

// Rows the core is allowed to pick up and transition.
inline bool isPending(SignalStatus status) {
  return status == SignalStatus::Process || status == SignalStatus::Modify;
}

inline bool isTerminal(SignalStatus status) {
  return status == SignalStatus::Done || status == SignalStatus::Invalid ||
         status == SignalStatus::Expired;
}

}  // namespace domain
}  // namespace sigexec
