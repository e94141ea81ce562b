#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>

#include "ContentHasher.hpp"
#include "DateResolver.hpp"
#include "DuplicateIndex.hpp"
#include "Placer.hpp"
#include "types.hpp"

class WorkerPool;

// Where a file was when it finished; FAILED names the stage in the log line.
enum class FileStage { SCANNED, HASHING, CLAIMING, PLACING, RECORDED, FAILED };

std::string_view to_string(FileStage stage);

struct RunSummary {
  std::int64_t session_id = 0;
  SessionCounters counters;
  bool completed = false;
  std::size_t workers = 0;
};

// One ingestion session: scan the source, hash and claim every candidate on
// the worker pool, place it, record the outcome.
class IngestPipeline {
 public:
  using ProgressHandler = std::function<void(const SessionCounters&)>;

  IngestPipeline(Config config, DuplicateIndex& index,
                 const DateResolver& date_resolver);

  IngestPipeline(const IngestPipeline&) = delete;
  IngestPipeline& operator=(const IngestPipeline&) = delete;

  // Blocks until the pool has drained. Throws IndexError when the session
  // cannot be opened or closed; per-file failures never escape.
  RunSummary run();

  // Cooperative cancellation, callable from any thread. Undispatched files
  // are dropped, in-flight files finish and the session ends as partial.
  void request_stop();
  bool stop_requested() const { return m_stop_requested; }

  SessionCounters progress() const;

  // Called from worker threads after every file.
  void set_progress_handler(ProgressHandler handler);

 private:
  void process(const CandidatePath& candidate, std::int64_t session_id);
  FileStatus ingest(const CandidatePath& candidate, std::int64_t session_id,
                    FileStage& stage, std::string& hash);
  void count(FileStatus status);
  void notify_progress();

  Config m_config;
  DuplicateIndex& m_index;
  const DateResolver& m_date_resolver;
  ContentHasher m_hasher;
  Placer m_placer;

  std::atomic<std::uint64_t> m_seen = 0;
  std::atomic<std::uint64_t> m_organized = 0;
  std::atomic<std::uint64_t> m_duplicate = 0;
  std::atomic<std::uint64_t> m_review = 0;
  std::atomic<std::uint64_t> m_error = 0;
  std::atomic<std::uint64_t> m_scan_errors = 0;

  std::atomic<bool> m_stop_requested = false;
  std::mutex m_pool_mutex;
  WorkerPool* m_pool = nullptr;

  std::mutex m_handler_mutex;
  ProgressHandler m_progress_handler;
};
