#pragma once

#include "sigexec/store/i_signal_store.hpp"
#include "sigexec/time/i_time_provider.hpp"

#include <sqlite3.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace sigexec {

// Thrown when the database cannot be opened or its schema created. This is a
// startup failure: the engine does not run without its queue.
class StoreError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// SqliteSignalStore — ISignalStore over the producer's SQLite file
// -----------------------------------------------------------------------------
//
// @brief  Reads and updates the `signals` table shared with the signal
//         producer.
//
// @details
// The producer and this engine are separate processes writing the same file.
// Two measures keep them from stepping on each other:
//
//   1. busy_timeout: a write that finds the database locked by the producer
//      waits up to kBusyTimeoutMs instead of failing immediately.
//   2. Guarded updates: setStatus() only touches a row that is still
//      PROCESS / MODIFY. If the producer's expiry sweep marked it EXPIRED
//      between our read and our write, the UPDATE matches nothing and the
//      producer's status wins.
//
// Every status write runs in its own BEGIN IMMEDIATE ... COMMIT transaction,
// so readers never see a half-applied update.
//
// The table is created if it does not exist, with the producer's column
// layout, so the engine can start before the producer has ever run.
//
// Ownership:
//   Owns the sqlite3 connection through a unique_ptr with a closing deleter.
//   Holds a const reference to the time provider used for updated_at.
//
// Thread model: tick thread only. The connection is not shared.
// -----------------------------------------------------------------------------
class SqliteSignalStore final : public ISignalStore {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Opens (creating if needed) the database and ensures the schema.
  //
  // @param  path   Filesystem path of the database, or ":memory:".
  // @param  clock  Source of updated_at timestamps. Must outlive the store.
  //
  // @throws StoreError if the file cannot be opened or the table created.
  // -------------------------------------------------------------------------
  SqliteSignalStore(const std::string& path, const ITimeProvider& clock);

  ~SqliteSignalStore() override = default;

  SqliteSignalStore(const SqliteSignalStore&) = delete;
  SqliteSignalStore& operator=(const SqliteSignalStore&) = delete;
  SqliteSignalStore(SqliteSignalStore&&) = delete;
  SqliteSignalStore& operator=(SqliteSignalStore&&) = delete;

  std::optional<std::vector<domain::Signal>> fetchPending(
      const std::vector<std::string>& whitelist) override;

  bool setStatus(domain::SignalId id, domain::SignalStatus status) override;

  const std::string& path() const { return path_; }

  // Raw handle for tests that need to seed rows directly.
  sqlite3* handle() const { return db_.get(); }

 private:
  static constexpr int kBusyTimeoutMs = 5000;

  struct ConnectionCloser {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
  };
  struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
  };
  using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

  // Prepares sql; returns an empty Statement and logs on failure.
  Statement prepare(const std::string& sql);

  // Executes a statement without results; logs and returns false on failure.
  bool exec(const char* sql);

  void ensureSchema();

  std::string path_;
  const ITimeProvider& clock_;
  std::unique_ptr<sqlite3, ConnectionCloser> db_;
};

}  // namespace sigexec
