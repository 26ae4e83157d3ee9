#include "sigexec/store/sqlite_signal_store.hpp"
#include "sigexec/store/status_codec.hpp"
#include "sigexec/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace sigexec {

namespace {

// Producer's table layout. Columns the core never reads (raw_message,
// content_hash, created_at) are still created so the producer can use a
// table this engine made first.
constexpr const char* kCreateTableSql =
    "CREATE TABLE IF NOT EXISTS signals ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " telegram_message_id INTEGER,"
    " telegram_channel_id INTEGER,"
    " symbol TEXT,"
    " direction TEXT,"
    " entry_min REAL,"
    " entry_max REAL,"
    " stop_loss REAL,"
    " take_profit_1 REAL,"
    " take_profit_2 REAL,"
    " take_profit_3 REAL,"
    " status TEXT,"
    " raw_message TEXT,"
    " content_hash TEXT,"
    " created_at DATETIME,"
    " updated_at DATETIME"
    ")";

constexpr const char* kSelectColumns =
    "SELECT id, telegram_message_id, telegram_channel_id, symbol, direction,"
    " entry_min, entry_max, stop_loss, take_profit_1, take_profit_2,"
    " take_profit_3, status FROM signals";

std::string toUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });
  return s;
}

bool isNull(sqlite3_stmt* stmt, int col) {
  return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

std::string columnText(sqlite3_stmt* stmt, int col) {
  const unsigned char* text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char*>(text) : std::string{};
}

std::optional<double> columnOptionalDouble(sqlite3_stmt* stmt, int col) {
  if (isNull(stmt, col)) {
    return std::nullopt;
  }
  return sqlite3_column_double(stmt, col);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: open + schema
// -----------------------------------------------------------------------------
SqliteSignalStore::SqliteSignalStore(const std::string& path,
                                     const ITimeProvider& clock)
    : path_(path), clock_(clock) {
  sqlite3* raw = nullptr;
  int rc = sqlite3_open_v2(path_.c_str(), &raw,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                           nullptr);
  // sqlite3_open_v2 hands back a handle even on failure; it must still be
  // closed, which the unique_ptr takes care of.
  db_.reset(raw);
  if (rc != SQLITE_OK) {
    std::string reason = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
    throw StoreError("cannot open signal store '" + path_ + "': " + reason);
  }

  sqlite3_busy_timeout(db_.get(), kBusyTimeoutMs);
  ensureSchema();

  std::cout << "[SignalStore] opened " << path_ << "\n";
}

void SqliteSignalStore::ensureSchema() {
  char* err = nullptr;
  int rc = sqlite3_exec(db_.get(), kCreateTableSql, nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string reason = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw StoreError("cannot create signals table in '" + path_ +
                     "': " + reason);
  }
}

// -----------------------------------------------------------------------------
// prepare / exec helpers
// -----------------------------------------------------------------------------
SqliteSignalStore::Statement SqliteSignalStore::prepare(
    const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  int rc = sqlite3_prepare_v2(db_.get(), sql.c_str(),
                              static_cast<int>(sql.size()), &raw, nullptr);
  Statement stmt(raw);
  if (rc != SQLITE_OK) {
    std::cerr << "[SignalStore] prepare failed: " << sqlite3_errmsg(db_.get())
              << "\n";
    return Statement{};
  }
  return stmt;
}

bool SqliteSignalStore::exec(const char* sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_.get(), sql, nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::cerr << "[SignalStore] '" << sql
              << "' failed: " << (err ? err : sqlite3_errstr(rc)) << "\n";
    sqlite3_free(err);
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// fetchPending
// -----------------------------------------------------------------------------
std::optional<std::vector<domain::Signal>> SqliteSignalStore::fetchPending(
    const std::vector<std::string>& whitelist) {
  std::vector<domain::Signal> signals;
  if (whitelist.empty()) {
    return signals;
  }

  std::string sql = kSelectColumns;
  sql += " WHERE UPPER(symbol) IN (";
  for (std::size_t i = 0; i < whitelist.size(); ++i) {
    sql += (i == 0) ? "?" : ",?";
  }
  sql += ") AND status IN ('PROCESS','MODIFY') ORDER BY id ASC";

  Statement stmt = prepare(sql);
  if (!stmt) {
    return std::nullopt;
  }

  for (std::size_t i = 0; i < whitelist.size(); ++i) {
    std::string symbol = toUpper(whitelist[i]);
    sqlite3_bind_text(stmt.get(), static_cast<int>(i + 1), symbol.c_str(), -1,
                      SQLITE_TRANSIENT);
  }

  while (true) {
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
      break;
    }
    if (rc != SQLITE_ROW) {
      std::cerr << "[SignalStore] fetchPending failed: "
                << sqlite3_errmsg(db_.get()) << "\n";
      return std::nullopt;
    }

    sqlite3_stmt* row = stmt.get();

    // Required prices: a NULL here means the producer wrote a broken row.
    if (isNull(row, 3) || isNull(row, 5) || isNull(row, 6) ||
        isNull(row, 7) || isNull(row, 8)) {
      continue;
    }
    auto direction = parseDirection(columnText(row, 4));
    if (!direction) {
      continue;
    }
    auto status = parseStatus(columnText(row, 11));
    if (!status) {
      continue;
    }

    domain::Signal s;
    s.id = sqlite3_column_int64(row, 0);
    s.source_message_id = sqlite3_column_int64(row, 1);
    s.source_channel_id = sqlite3_column_int64(row, 2);
    s.symbol = columnText(row, 3);
    s.direction = *direction;
    s.entry_min = sqlite3_column_double(row, 5);
    s.entry_max = sqlite3_column_double(row, 6);
    s.stop_loss = sqlite3_column_double(row, 7);
    s.take_profit_1 = sqlite3_column_double(row, 8);
    s.take_profit_2 = columnOptionalDouble(row, 9);
    s.take_profit_3 = columnOptionalDouble(row, 10);
    s.status = *status;
    signals.push_back(std::move(s));
  }

  return signals;
}

// -----------------------------------------------------------------------------
// setStatus: single-row guarded update inside BEGIN IMMEDIATE
// -----------------------------------------------------------------------------
bool SqliteSignalStore::setStatus(domain::SignalId id,
                                  domain::SignalStatus status) {
  using S = domain::SignalStatus;
  if (status != S::Done && status != S::Invalid && status != S::Error) {
    std::cerr << "[SignalStore] refusing to write status "
              << statusToText(status) << " for signal " << id << "\n";
    return false;
  }

  Statement stmt = prepare(
      "UPDATE signals SET status = ?, updated_at = ?"
      " WHERE id = ? AND status IN ('PROCESS','MODIFY')");
  if (!stmt) {
    return false;
  }

  const std::string updated_at = format_storage_time(clock_.now_ms());
  sqlite3_bind_text(stmt.get(), 1, statusToText(status), -1, SQLITE_STATIC);
  sqlite3_bind_text(stmt.get(), 2, updated_at.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 3, id);

  if (!exec("BEGIN IMMEDIATE")) {
    return false;
  }

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    std::cerr << "[SignalStore] status update for signal " << id
              << " failed: " << sqlite3_errmsg(db_.get()) << "\n";
    exec("ROLLBACK");
    return false;
  }
  const int changed = sqlite3_changes(db_.get());

  if (!exec("COMMIT")) {
    exec("ROLLBACK");
    return false;
  }

  if (changed == 0) {
    std::cerr << "[SignalStore] signal " << id
              << " is no longer pending; status " << statusToText(status)
              << " not applied\n";
  }
  return true;
}

}  // namespace sigexec
