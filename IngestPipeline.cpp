#include "IngestPipeline.hpp"

#include <chrono>
#include <format>
#include <variant>

#include "Classifier.hpp"
#include "IOManager.hpp"
#include "PathScanner.hpp"
#include "WorkerPool.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace {
void check_deadline(const ContentHasher::Deadline& deadline,
                    const fs::path& path) {
  if (deadline && std::chrono::steady_clock::now() > *deadline) {
    throw FileTimeoutError(std::format("Timed out before placing '{}'",
                                       safe_path_to_string(path)));
  }
}
}  // namespace

std::string_view to_string(FileStage stage) {
  switch (stage) {
    case FileStage::SCANNED:
      return "scanned";
    case FileStage::HASHING:
      return "hashing";
    case FileStage::CLAIMING:
      return "claiming";
    case FileStage::PLACING:
      return "placing";
    case FileStage::RECORDED:
      return "recorded";
    default:
      return "failed";
  }
}

IngestPipeline::IngestPipeline(Config config, DuplicateIndex& index,
                               const DateResolver& date_resolver)
    : m_config(std::move(config)),
      m_index(index),
      m_date_resolver(date_resolver),
      m_hasher(m_config.performance.buffer_size,
               m_config.performance.hash_algorithm),
      m_placer(m_config.destination, m_config.transfer_mode, m_config.dry_run,
               m_hasher) {}

RunSummary IngestPipeline::run() {
  RunSummary summary;
  summary.session_id = m_index.begin_session(json(m_config).dump());
  summary.workers = resolve_worker_count(m_config.parallel);

  IOManager::log(std::format(
      "[SESSION] Session {} started{}: '{}' -> '{}' with {} worker(s)",
      summary.session_id, m_config.dry_run ? " (dry run)" : "",
      safe_path_to_string(m_config.source),
      safe_path_to_string(m_config.destination), summary.workers));

  PathScanner scanner(m_config.source, m_config.scan);
  {
    WorkerPool pool(summary.workers, summary.workers * 4);
    {
      std::scoped_lock lock(m_pool_mutex);
      m_pool = &pool;
    }
    // A stop that arrived before the pool existed.
    if (m_stop_requested) pool.request_stop();

    const std::int64_t session_id = summary.session_id;
    try {
      while (!m_stop_requested) {
        auto candidate = scanner.next();
        if (!candidate) break;
        const bool accepted = pool.submit(
            [this, session_id, candidate = std::move(*candidate)](
                std::stop_token) { process(candidate, session_id); });
        if (!accepted) break;
      }
    } catch (const fs::filesystem_error& e) {
      // Files already queued still finish; the session ends as partial.
      IOManager::log(std::format("[ERROR] Scan of '{}' aborted: {}",
                                 safe_path_to_string(m_config.source),
                                 e.what()));
      m_stop_requested = true;
    }
    pool.drain();

    if (pool.dropped() > 0) {
      IOManager::log(std::format("[SESSION] Stop requested, {} queued file(s) "
                                 "were not processed",
                                 pool.dropped()));
    }
    std::scoped_lock lock(m_pool_mutex);
    m_pool = nullptr;
  }

  const ScanStats& scan = scanner.stats();
  m_scan_errors = scan.scan_errors;
  IOManager::log(std::format(
      "[SCAN] {} candidate(s), {} unsupported, {} excluded file(s), {} "
      "excluded dir(s), {} scan error(s)",
      scan.candidates, scan.unsupported_files, scan.skipped_files,
      scan.skipped_dirs, scan.scan_errors));

  summary.counters = progress();
  summary.completed = !m_stop_requested;
  m_index.finalize_session(summary.session_id, summary.counters,
                           summary.completed);

  if (m_config.database_config.vacuum_on_completion && !m_index.in_memory()) {
    m_index.optimize();
  }

  const SessionCounters& c = summary.counters;
  IOManager::log(std::format(
      "[SESSION] Session {} {}: seen={} organized={} duplicate={} review={} "
      "error={} scan_errors={}",
      summary.session_id, summary.completed ? "completed" : "partial", c.seen,
      c.organized, c.duplicate, c.review, c.error, c.scan_errors));
  notify_progress();
  return summary;
}

void IngestPipeline::request_stop() {
  if (m_stop_requested.exchange(true)) return;
  IOManager::log("[SESSION] Stop requested");
  std::scoped_lock lock(m_pool_mutex);
  if (m_pool) m_pool->request_stop();
}

SessionCounters IngestPipeline::progress() const {
  SessionCounters counters;
  counters.seen = m_seen;
  counters.organized = m_organized;
  counters.duplicate = m_duplicate;
  counters.review = m_review;
  counters.error = m_error;
  counters.scan_errors = m_scan_errors;
  return counters;
}

void IngestPipeline::set_progress_handler(ProgressHandler handler) {
  std::scoped_lock lock(m_handler_mutex);
  m_progress_handler = std::move(handler);
}

void IngestPipeline::notify_progress() {
  std::scoped_lock lock(m_handler_mutex);
  if (m_progress_handler) m_progress_handler(progress());
}

void IngestPipeline::count(FileStatus status) {
  switch (status) {
    case FileStatus::ORGANIZED:
      ++m_organized;
      break;
    case FileStatus::DUPLICATE:
      ++m_duplicate;
      break;
    case FileStatus::REVIEW:
      ++m_review;
      break;
    default:
      ++m_error;
      break;
  }
}

void IngestPipeline::process(const CandidatePath& candidate,
                             std::int64_t session_id) {
  ++m_seen;
  FileStage stage = FileStage::SCANNED;
  std::string hash;
  try {
    count(ingest(candidate, session_id, stage, hash));
  } catch (const std::exception& e) {
    IOManager::log(std::format("[ERROR] '{}' failed while {}: {}",
                               safe_path_to_string(candidate.path),
                               to_string(stage), e.what()));
    ++m_error;
    try {
      m_index.record_failure(candidate.path, hash, candidate.media_type,
                             std::format("{}: {}", to_string(stage), e.what()),
                             session_id);
    } catch (const IndexError& record_error) {
      IOManager::log(std::format("[ERROR] Could not record failure of '{}': {}",
                                 safe_path_to_string(candidate.path),
                                 record_error.what()));
    }
  }
  notify_progress();
}

FileStatus IngestPipeline::ingest(const CandidatePath& candidate,
                                  std::int64_t session_id, FileStage& stage,
                                  std::string& hash) {
  const fs::path& path = candidate.path;
  ContentHasher::Deadline deadline;
  if (m_config.performance.file_timeout_seconds > 0) {
    deadline = std::chrono::steady_clock::now() +
               std::chrono::seconds(m_config.performance.file_timeout_seconds);
  }

  const std::optional<CaptureDate> capture_date =
      m_date_resolver.resolve(path);

  stage = FileStage::HASHING;
  hash = m_hasher.hash_file(path, deadline);

  stage = FileStage::CLAIMING;
  const Classification wanted = Classifier::classify(
      candidate.media_type, capture_date, ClaimWon{}, path.filename());
  ClaimRequest request;
  request.hash = hash;
  request.media_type = candidate.media_type;
  request.status = Classifier::canonical_status(capture_date);
  request.source_path = path;
  request.destination = m_placer.resolve(wanted.relative_path, hash);
  request.capture_date = capture_date;

  const ClaimResult claim = m_index.claim(request, session_id);
  const Classification outcome = Classifier::classify(
      candidate.media_type, capture_date, claim, path.filename());

  stage = FileStage::PLACING;
  if (const auto* won = std::get_if<ClaimWon>(&claim)) {
    try {
      check_deadline(deadline, path);
      m_placer.place(path, won->destination, hash, CollisionPolicy::EXACT);
    } catch (const std::exception&) {
      m_index.release(won->record_id);
      throw;
    }
    stage = FileStage::RECORDED;
    return request.status;
  }

  const auto& lost = std::get<ClaimLost>(claim);
  if (lost.source_path == path) {
    if (m_placer.holds(lost.destination, hash)) {
      IOManager::log(std::format("[CLAIM] '{}' already archived at '{}'",
                                 safe_path_to_string(path),
                                 safe_path_to_string(lost.destination)));
    } else {
      // Claimed by a run that stopped before writing the file.
      IOManager::log(std::format("[CLAIM] '{}' missing from '{}', placing again",
                                 safe_path_to_string(path),
                                 safe_path_to_string(lost.destination)));
      check_deadline(deadline, path);
      m_placer.place(path, lost.destination, hash, CollisionPolicy::EXACT);
    }
  } else {
    IOManager::log(std::format("[CLAIM] '{}' duplicates '{}'",
                               safe_path_to_string(path),
                               safe_path_to_string(lost.source_path)));
    check_deadline(deadline, path);
    m_placer.place(path, outcome.relative_path, hash, CollisionPolicy::RESOLVE);
  }
  stage = FileStage::RECORDED;
  return FileStatus::DUPLICATE;
}
