#include "DuplicateIndex.hpp"

#include <sqlite3.h>

#include <chrono>
#include <format>
#include <string_view>
#include <thread>

#include "IOManager.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace {
[[noreturn]] void throw_sqlite(sqlite3* db, int rc, std::string_view what) {
  const int primary = rc & 0xff;
  std::string message =
      std::format("{} failed: {}", what,
                  db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
  if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
    throw IndexBusyError(message);
  }
  throw IndexError(message);
}

class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : m_db(db) {
    const int rc = sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr);
    if (rc != SQLITE_OK) throw_sqlite(db, rc, "prepare");
  }
  ~Statement() { sqlite3_finalize(m_stmt); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& bind_text(int index, std::string_view text) {
    check(sqlite3_bind_text(m_stmt, index, text.data(),
                            static_cast<int>(text.size()), SQLITE_TRANSIENT));
    return *this;
  }
  Statement& bind_int64(int index, std::int64_t value) {
    check(sqlite3_bind_int64(m_stmt, index, value));
    return *this;
  }
  Statement& bind_null(int index) {
    check(sqlite3_bind_null(m_stmt, index));
    return *this;
  }

  // SQLITE_ROW, SQLITE_DONE or a failure code; the caller decides.
  int step() { return sqlite3_step(m_stmt); }

  // Runs a statement that must complete without returning rows.
  void run(std::string_view what) {
    const int rc = step();
    if (rc != SQLITE_DONE) throw_sqlite(m_db, rc, what);
  }

  bool is_null(int col) const {
    return sqlite3_column_type(m_stmt, col) == SQLITE_NULL;
  }
  std::int64_t int64(int col) const { return sqlite3_column_int64(m_stmt, col); }
  std::string text(int col) const {
    const auto* raw = sqlite3_column_text(m_stmt, col);
    return raw != nullptr ? reinterpret_cast<const char*>(raw) : std::string();
  }

 private:
  void check(int rc) {
    if (rc != SQLITE_OK) throw_sqlite(m_db, rc, "bind");
  }

  sqlite3* m_db;
  sqlite3_stmt* m_stmt = nullptr;
};

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() was reached.
class Transaction {
 public:
  explicit Transaction(sqlite3* db) : m_db(db) {
    const int rc = sqlite3_exec(db, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) throw_sqlite(db, rc, "begin transaction");
  }
  ~Transaction() {
    if (!m_done) sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    const int rc = sqlite3_exec(m_db, "COMMIT", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) throw_sqlite(m_db, rc, "commit");
    m_done = true;
  }

 private:
  sqlite3* m_db;
  bool m_done = false;
};

constexpr const char* kRecordColumns =
    "id, hash, source_path, dest_path, media_type, year, month, status, "
    "canonical_id, session_id, created_at, detail";

FileRecord read_record(const Statement& row) {
  FileRecord record;
  record.id = row.int64(0);
  record.hash = row.text(1);
  record.source_path = path_from_utf8(row.text(2));
  if (!row.is_null(3)) record.dest_path = path_from_utf8(row.text(3));
  record.media_type = media_type_from_string(row.text(4));
  if (!row.is_null(5) && !row.is_null(6)) {
    record.capture_date = CaptureDate{static_cast<int>(row.int64(5)),
                                      static_cast<int>(row.int64(6))};
  }
  record.status = file_status_from_string(row.text(7));
  if (!row.is_null(8)) record.canonical_id = row.int64(8);
  record.session_id = row.int64(9);
  record.created_at = row.text(10);
  record.detail = row.text(11);
  return record;
}

void bind_date(Statement& stmt, int year_index,
               const std::optional<CaptureDate>& date) {
  if (date) {
    stmt.bind_int64(year_index, date->year).bind_int64(year_index + 1, date->month);
  } else {
    stmt.bind_null(year_index).bind_null(year_index + 1);
  }
}

SessionState session_state_from_string(std::string_view text) {
  if (text == "completed") return SessionState::COMPLETED;
  if (text == "partial") return SessionState::PARTIAL;
  return SessionState::RUNNING;
}
}  // namespace

DuplicateIndex::DuplicateIndex(const fs::path& database,
                               const DatabaseConfig& config)
    : m_in_memory(database == IN_MEMORY), m_config(config) {
  if (!m_in_memory && database.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(database.parent_path(), ec);
    if (ec) {
      throw IndexError(std::format("Cannot create database directory '{}': {}",
                                   safe_path_to_string(database.parent_path()),
                                   ec.message()));
    }
  }

  const std::string location = safe_path_to_string(database);
  const int rc = sqlite3_open_v2(
      location.c_str(), &m_db,
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string message = m_db != nullptr ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
    sqlite3_close(m_db);
    m_db = nullptr;
    throw IndexError(std::format("Cannot open database '{}': {}", location, message));
  }

  try {
    sqlite3_extended_result_codes(m_db, 1);
    sqlite3_busy_timeout(m_db, m_config.connection_timeout * 1000);
    if (!m_in_memory && m_config.enable_wal_mode) {
      exec("PRAGMA journal_mode=WAL");
      exec("PRAGMA synchronous=NORMAL");
    }
    migrate();
  } catch (...) {
    sqlite3_close(m_db);
    m_db = nullptr;
    throw;
  }

  IOManager::log(std::format("[CLAIM] Duplicate index ready ({})",
                             m_in_memory ? "in-memory" : location));
}

DuplicateIndex::~DuplicateIndex() { sqlite3_close(m_db); }

void DuplicateIndex::exec(const char* sql) {
  char* error = nullptr;
  const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &error);
  if (rc != SQLITE_OK) {
    std::string message = error != nullptr ? error : sqlite3_errstr(rc);
    sqlite3_free(error);
    const int primary = rc & 0xff;
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
      throw IndexBusyError(message);
    }
    throw IndexError(std::format("'{}' failed: {}", sql, message));
  }
}

void DuplicateIndex::migrate() {
  const char* ddl[] = {
      "CREATE TABLE IF NOT EXISTS sessions (\n"
      "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
      "  started_at TEXT NOT NULL,\n"
      "  ended_at TEXT NULL,\n"
      "  config_snapshot TEXT NOT NULL,\n"
      "  state TEXT NOT NULL DEFAULT 'running',\n"
      "  files_seen INTEGER NOT NULL DEFAULT 0,\n"
      "  organized INTEGER NOT NULL DEFAULT 0,\n"
      "  duplicates INTEGER NOT NULL DEFAULT 0,\n"
      "  review INTEGER NOT NULL DEFAULT 0,\n"
      "  errors INTEGER NOT NULL DEFAULT 0,\n"
      "  scan_errors INTEGER NOT NULL DEFAULT 0\n"
      ");",
      "CREATE TABLE IF NOT EXISTS files (\n"
      "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
      "  hash TEXT NOT NULL,\n"
      "  source_path TEXT NOT NULL,\n"
      "  dest_path TEXT NULL,\n"
      "  media_type TEXT NOT NULL,\n"
      "  year INTEGER NULL,\n"
      "  month INTEGER NULL,\n"
      "  status TEXT NOT NULL CHECK (status IN "
      "('organized', 'review', 'duplicate', 'error')),\n"
      "  canonical_id INTEGER NULL,\n"
      "  session_id INTEGER NOT NULL,\n"
      "  detail TEXT NULL,\n"
      "  created_at TEXT DEFAULT CURRENT_TIMESTAMP\n"
      ");",
      // The claim: at most one first-seen copy per hash...
      "CREATE UNIQUE INDEX IF NOT EXISTS ux_files_canonical_hash ON files(hash) "
      "WHERE status IN ('organized', 'review');",
      // ...and never two first-seen copies at one destination.
      "CREATE UNIQUE INDEX IF NOT EXISTS ux_files_canonical_dest ON "
      "files(dest_path) WHERE status IN ('organized', 'review');",
      "CREATE INDEX IF NOT EXISTS idx_files_session ON files(session_id);",
      "CREATE INDEX IF NOT EXISTS idx_files_status ON files(status);",
      "CREATE INDEX IF NOT EXISTS idx_files_source ON files(source_path);",
  };
  for (const char* sql : ddl) exec(sql);
}

ClaimResult DuplicateIndex::claim(const ClaimRequest& request,
                                  std::int64_t session_id) {
  for (int attempt = 0;; ++attempt) {
    try {
      std::scoped_lock lock(m_mutex);
      return claim_once(request, session_id);
    } catch (const IndexBusyError& e) {
      if (attempt >= m_config.claim_retries) {
        throw IndexBusyError(std::format("Store busy after {} attempts: {}",
                                         attempt + 1, e.what()));
      }
      const auto delay =
          std::chrono::milliseconds(m_config.claim_backoff_ms) * (1 << attempt);
      IOManager::log(std::format("[CLAIM] Store busy, retrying '{}' in {} ms",
                                 safe_path_to_string(request.source_path),
                                 delay.count()));
      std::this_thread::sleep_for(delay);
    }
  }
}

ClaimResult DuplicateIndex::claim_once(const ClaimRequest& request,
                                       std::int64_t session_id) {
  Transaction tx(m_db);

  const fs::path names[] = {
      request.destination, hash_suffixed_path(request.destination, request.hash),
      hash_suffixed_path(request.destination, request.hash, std::string::npos)};

  for (const auto& name : names) {
    Statement insert(m_db,
                     "INSERT INTO files (hash, source_path, dest_path, media_type, "
                     "year, month, status, session_id) "
                     "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)");
    insert.bind_text(1, request.hash)
        .bind_text(2, safe_path_to_string(request.source_path))
        .bind_text(3, safe_path_to_string(name))
        .bind_text(4, to_string(request.media_type));
    bind_date(insert, 5, request.capture_date);
    insert.bind_text(7, to_string(request.status)).bind_int64(8, session_id);

    const int rc = insert.step();
    if (rc == SQLITE_DONE) {
      const std::int64_t id = sqlite3_last_insert_rowid(m_db);
      tx.commit();
      return ClaimWon{id, name};
    }
    if ((rc & 0xff) != SQLITE_CONSTRAINT) throw_sqlite(m_db, rc, "claim");

    if (auto winner = find_canonical(request.hash)) {
      Statement duplicate(
          m_db,
          "INSERT INTO files (hash, source_path, dest_path, media_type, year, "
          "month, status, canonical_id, session_id) "
          "VALUES (?1, ?2, ?3, ?4, ?5, ?6, 'duplicate', ?7, ?8)");
      duplicate.bind_text(1, request.hash)
          .bind_text(2, safe_path_to_string(request.source_path))
          .bind_text(3, safe_path_to_string(winner->dest_path))
          .bind_text(4, to_string(request.media_type));
      bind_date(duplicate, 5, request.capture_date);
      duplicate.bind_int64(7, winner->id).bind_int64(8, session_id);
      duplicate.run("duplicate insert");
      tx.commit();
      return ClaimLost{winner->id, winner->dest_path, winner->source_path};
    }
    // Another file with different bytes holds this destination name.
  }

  throw IndexError(std::format("No free destination for '{}'",
                               safe_path_to_string(request.destination)));
}

std::optional<FileRecord> DuplicateIndex::find_canonical(
    const std::string& hash) {
  const std::string sql =
      std::format("SELECT {} FROM files WHERE hash = ?1 AND status IN "
                  "('organized', 'review')",
                  kRecordColumns);
  Statement query(m_db, sql.c_str());
  query.bind_text(1, hash);
  const int rc = query.step();
  if (rc == SQLITE_ROW) return read_record(query);
  if (rc != SQLITE_DONE) throw_sqlite(m_db, rc, "canonical lookup");
  return std::nullopt;
}

void DuplicateIndex::release(std::int64_t record_id) {
  std::scoped_lock lock(m_mutex);
  Transaction tx(m_db);

  // Duplicates already matched against this claim would otherwise point at
  // a missing record and a destination that was never written.
  Statement orphan(m_db,
                   "UPDATE files SET status = 'error', canonical_id = NULL, "
                   "dest_path = NULL, detail = 'canonical placement failed' "
                   "WHERE canonical_id = ?1 AND status = 'duplicate'");
  orphan.bind_int64(1, record_id).run("release duplicates");

  Statement remove(m_db,
                   "DELETE FROM files WHERE id = ?1 AND status IN "
                   "('organized', 'review')");
  remove.bind_int64(1, record_id).run("release");
  tx.commit();
}

std::int64_t DuplicateIndex::record_failure(const fs::path& source_path,
                                            const std::string& hash,
                                            MediaType media_type,
                                            const std::string& detail,
                                            std::int64_t session_id) {
  std::scoped_lock lock(m_mutex);
  Statement insert(m_db,
                   "INSERT INTO files (hash, source_path, media_type, status, "
                   "session_id, detail) VALUES (?1, ?2, ?3, 'error', ?4, ?5)");
  insert.bind_text(1, hash)
      .bind_text(2, safe_path_to_string(source_path))
      .bind_text(3, to_string(media_type))
      .bind_int64(4, session_id)
      .bind_text(5, detail);
  insert.run("error insert");
  return sqlite3_last_insert_rowid(m_db);
}

std::int64_t DuplicateIndex::begin_session(const std::string& config_snapshot) {
  std::scoped_lock lock(m_mutex);
  Statement insert(m_db,
                   "INSERT INTO sessions (started_at, config_snapshot) "
                   "VALUES (datetime('now', 'localtime'), ?1)");
  insert.bind_text(1, config_snapshot).run("session start");
  return sqlite3_last_insert_rowid(m_db);
}

void DuplicateIndex::finalize_session(std::int64_t session_id,
                                      const SessionCounters& counters,
                                      bool completed) {
  std::scoped_lock lock(m_mutex);
  Statement update(m_db,
                   "UPDATE sessions SET ended_at = datetime('now', 'localtime'), "
                   "state = ?1, files_seen = ?2, organized = ?3, duplicates = ?4, "
                   "review = ?5, errors = ?6, scan_errors = ?7 WHERE id = ?8");
  update.bind_text(1, completed ? "completed" : "partial")
      .bind_int64(2, static_cast<std::int64_t>(counters.seen))
      .bind_int64(3, static_cast<std::int64_t>(counters.organized))
      .bind_int64(4, static_cast<std::int64_t>(counters.duplicate))
      .bind_int64(5, static_cast<std::int64_t>(counters.review))
      .bind_int64(6, static_cast<std::int64_t>(counters.error))
      .bind_int64(7, static_cast<std::int64_t>(counters.scan_errors))
      .bind_int64(8, session_id);
  update.run("session finalize");
}

std::optional<SessionInfo> DuplicateIndex::session(std::int64_t session_id) {
  std::scoped_lock lock(m_mutex);
  Statement query(m_db,
                  "SELECT id, started_at, ended_at, config_snapshot, state, "
                  "files_seen, organized, duplicates, review, errors, scan_errors "
                  "FROM sessions WHERE id = ?1");
  query.bind_int64(1, session_id);
  const int rc = query.step();
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw_sqlite(m_db, rc, "session lookup");

  SessionInfo info;
  info.id = query.int64(0);
  info.started_at = query.text(1);
  info.ended_at = query.text(2);
  info.config_snapshot = query.text(3);
  info.state = session_state_from_string(query.text(4));
  info.counters.seen = static_cast<std::uint64_t>(query.int64(5));
  info.counters.organized = static_cast<std::uint64_t>(query.int64(6));
  info.counters.duplicate = static_cast<std::uint64_t>(query.int64(7));
  info.counters.review = static_cast<std::uint64_t>(query.int64(8));
  info.counters.error = static_cast<std::uint64_t>(query.int64(9));
  info.counters.scan_errors = static_cast<std::uint64_t>(query.int64(10));
  return info;
}

std::optional<FileRecord> DuplicateIndex::canonical_for(const std::string& hash) {
  std::scoped_lock lock(m_mutex);
  return find_canonical(hash);
}

std::vector<FileRecord> DuplicateIndex::query_records(
    const char* sql, std::optional<std::int64_t> param) {
  std::scoped_lock lock(m_mutex);
  Statement query(m_db, sql);
  if (param) query.bind_int64(1, *param);

  std::vector<FileRecord> records;
  int rc;
  while ((rc = query.step()) == SQLITE_ROW) {
    records.push_back(read_record(query));
  }
  if (rc != SQLITE_DONE) throw_sqlite(m_db, rc, "record query");
  return records;
}

std::vector<FileRecord> DuplicateIndex::records_for_session(
    std::int64_t session_id) {
  const std::string sql = std::format(
      "SELECT {} FROM files WHERE session_id = ?1 ORDER BY id", kRecordColumns);
  return query_records(sql.c_str(), session_id);
}

std::vector<FileRecord> DuplicateIndex::all_records() {
  const std::string sql =
      std::format("SELECT {} FROM files ORDER BY id", kRecordColumns);
  return query_records(sql.c_str(), std::nullopt);
}

std::map<FileStatus, std::int64_t> DuplicateIndex::count_by_status(
    std::optional<std::int64_t> session_id) {
  std::scoped_lock lock(m_mutex);
  Statement query(m_db, session_id
                            ? "SELECT status, COUNT(*) FROM files WHERE "
                              "session_id = ?1 GROUP BY status"
                            : "SELECT status, COUNT(*) FROM files GROUP BY status");
  if (session_id) query.bind_int64(1, *session_id);

  std::map<FileStatus, std::int64_t> counts;
  int rc;
  while ((rc = query.step()) == SQLITE_ROW) {
    counts[file_status_from_string(query.text(0))] = query.int64(1);
  }
  if (rc != SQLITE_DONE) throw_sqlite(m_db, rc, "status count");
  return counts;
}

StoreStatistics DuplicateIndex::statistics() {
  StoreStatistics stats;
  stats.by_status = count_by_status();

  std::scoped_lock lock(m_mutex);
  int rc;
  Statement media(m_db,
                  "SELECT media_type, COUNT(*) FROM files WHERE status IN "
                  "('organized', 'review') GROUP BY media_type");
  while ((rc = media.step()) == SQLITE_ROW) {
    stats.by_media[media_type_from_string(media.text(0))] = media.int64(1);
  }
  if (rc != SQLITE_DONE) throw_sqlite(m_db, rc, "media statistics");

  Statement years(m_db,
                  "SELECT year, COUNT(*) FROM files WHERE status = 'organized' "
                  "AND year IS NOT NULL GROUP BY year ORDER BY year DESC");
  while ((rc = years.step()) == SQLITE_ROW) {
    stats.by_year[static_cast<int>(years.int64(0))] = years.int64(1);
  }
  if (rc != SQLITE_DONE) throw_sqlite(m_db, rc, "yearly statistics");
  return stats;
}

void DuplicateIndex::optimize() {
  if (m_in_memory) return;
  std::scoped_lock lock(m_mutex);
  exec("VACUUM");
  exec("ANALYZE");
  IOManager::log("[SESSION] Database optimized");
}
