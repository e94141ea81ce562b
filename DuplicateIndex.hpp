#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

struct sqlite3;

struct StoreStatistics {
  std::map<FileStatus, std::int64_t> by_status;
  std::map<MediaType, std::int64_t> by_media;
  std::map<int, std::int64_t> by_year;  // canonical records with a date
};

// The shared, durable record of every decision and the single source of
// truth for "have we archived these bytes before".
//
// The claim protocol: a first-seen copy is an INSERT with status organized
// or review, guarded by a partial UNIQUE index on the hash. The insert either
// succeeds (the caller won) or trips the constraint, in which case the
// caller's record goes in as a duplicate of the row that beat it, inside the
// same transaction. There is no separate existence check.
//
// One SQLite connection, serialized by an internal mutex; callers never hold
// a lock of their own across a claim. ":memory:" gives the volatile store
// used by dry runs with the same schema and semantics.
class DuplicateIndex {
 public:
  static constexpr const char* IN_MEMORY = ":memory:";

  DuplicateIndex(const fs::path& database, const DatabaseConfig& config = {});
  ~DuplicateIndex();

  DuplicateIndex(const DuplicateIndex&) = delete;
  DuplicateIndex& operator=(const DuplicateIndex&) = delete;

  ClaimResult claim(const ClaimRequest& request, std::int64_t session_id);

  // Withdraws a won claim whose file never reached its destination.
  // Duplicates matched against it become error records.
  void release(std::int64_t record_id);

  std::int64_t record_failure(const fs::path& source_path,
                              const std::string& hash, MediaType media_type,
                              const std::string& detail,
                              std::int64_t session_id);

  std::int64_t begin_session(const std::string& config_snapshot);
  void finalize_session(std::int64_t session_id,
                        const SessionCounters& counters, bool completed);
  std::optional<SessionInfo> session(std::int64_t session_id);

  std::optional<FileRecord> canonical_for(const std::string& hash);
  std::vector<FileRecord> records_for_session(std::int64_t session_id);
  std::vector<FileRecord> all_records();
  std::map<FileStatus, std::int64_t> count_by_status(
      std::optional<std::int64_t> session_id = std::nullopt);
  StoreStatistics statistics();

  // VACUUM + ANALYZE; no-op for the in-memory store.
  void optimize();

  bool in_memory() const { return m_in_memory; }

 private:
  void migrate();
  void exec(const char* sql);
  ClaimResult claim_once(const ClaimRequest& request, std::int64_t session_id);
  std::optional<FileRecord> find_canonical(const std::string& hash);
  std::vector<FileRecord> query_records(const char* sql,
                                        std::optional<std::int64_t> param);

  sqlite3* m_db = nullptr;
  bool m_in_memory;
  DatabaseConfig m_config;
  std::mutex m_mutex;
};
