#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

enum class MediaType { PHOTO, VIDEO, UNKNOWN };
NLOHMANN_JSON_SERIALIZE_ENUM(MediaType, {{MediaType::UNKNOWN, "unknown"},
                                         {MediaType::PHOTO, "photo"},
                                         {MediaType::VIDEO, "video"}});

enum class FileStatus { ORGANIZED, DUPLICATE, REVIEW, ERROR };
NLOHMANN_JSON_SERIALIZE_ENUM(FileStatus, {{FileStatus::ERROR, "error"},
                                          {FileStatus::ORGANIZED, "organized"},
                                          {FileStatus::DUPLICATE, "duplicate"},
                                          {FileStatus::REVIEW, "review"}});

enum class TransferMode { COPY, MOVE };
NLOHMANN_JSON_SERIALIZE_ENUM(TransferMode, {{TransferMode::COPY, "copy"},
                                            {TransferMode::MOVE, "move"}});

inline std::string_view to_string(MediaType type) {
  switch (type) {
    case MediaType::PHOTO:
      return "photo";
    case MediaType::VIDEO:
      return "video";
    default:
      return "unknown";
  }
}

inline MediaType media_type_from_string(std::string_view text) {
  if (text == "photo") return MediaType::PHOTO;
  if (text == "video") return MediaType::VIDEO;
  return MediaType::UNKNOWN;
}

inline std::string_view to_string(FileStatus status) {
  switch (status) {
    case FileStatus::ORGANIZED:
      return "organized";
    case FileStatus::DUPLICATE:
      return "duplicate";
    case FileStatus::REVIEW:
      return "review";
    default:
      return "error";
  }
}

inline FileStatus file_status_from_string(std::string_view text) {
  if (text == "organized") return FileStatus::ORGANIZED;
  if (text == "duplicate") return FileStatus::DUPLICATE;
  if (text == "review") return FileStatus::REVIEW;
  return FileStatus::ERROR;
}

struct CaptureDate {
  int year = 0;
  int month = 0;

  bool operator==(const CaptureDate&) const = default;
};

// A file the scanner accepted, with the media type its extension implies.
struct CandidatePath {
  fs::path path;
  MediaType media_type = MediaType::UNKNOWN;
};

// --- Configuration -------------------------------------------------------

struct ScanConfig {
  bool exclude_hidden_dirs = true;
  std::vector<std::string> exclude_patterns;
  std::vector<std::string> photo_extensions;
  std::vector<std::string> video_extensions;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ScanConfig, exclude_hidden_dirs,
                                                exclude_patterns,
                                                photo_extensions,
                                                video_extensions);

struct ParallelConfig {
  bool enabled = true;
  std::optional<int> max_workers;  // unset = auto-detect
  int cpu_multiplier = 2;
  int max_workers_limit = 16;
};

inline void from_json(const json& j, ParallelConfig& p) {
  p.enabled = j.value("enabled", p.enabled);
  if (j.contains("max_workers") && !j.at("max_workers").is_null()) {
    p.max_workers = j.at("max_workers").get<int>();
  }
  p.cpu_multiplier = j.value("cpu_multiplier", p.cpu_multiplier);
  p.max_workers_limit = j.value("max_workers_limit", p.max_workers_limit);
}

inline void to_json(json& j, const ParallelConfig& p) {
  j = json{{"enabled", p.enabled},
           {"max_workers", p.max_workers ? json(*p.max_workers) : json()},
           {"cpu_multiplier", p.cpu_multiplier},
           {"max_workers_limit", p.max_workers_limit}};
}

struct PerformanceConfig {
  std::size_t buffer_size = 64 * 1024;
  std::string hash_algorithm = "sha256";
  int file_timeout_seconds = 0;  // 0 = no per-file timeout
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(PerformanceConfig, buffer_size,
                                                hash_algorithm,
                                                file_timeout_seconds);

struct DatabaseConfig {
  int connection_timeout = 30;
  bool enable_wal_mode = true;
  bool vacuum_on_completion = true;
  int claim_retries = 5;
  int claim_backoff_ms = 50;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(DatabaseConfig,
                                                connection_timeout,
                                                enable_wal_mode,
                                                vacuum_on_completion,
                                                claim_retries,
                                                claim_backoff_ms);

struct Config {
  fs::path source;
  fs::path destination;
  fs::path database = "media-archiver.db";
  fs::path log = "media-archiver.log";
  ScanConfig scan;
  TransferMode transfer_mode = TransferMode::COPY;
  ParallelConfig parallel;
  PerformanceConfig performance;
  DatabaseConfig database_config;
  bool dry_run = false;
};

inline void from_json(const json& j, Config& c) {
  j.at("source").get_to(c.source);
  j.at("destination").get_to(c.destination);
  c.database = j.value("database", c.database);
  c.log = j.value("log", c.log);
  c.scan.exclude_hidden_dirs =
      j.value("exclude_hidden_dirs", c.scan.exclude_hidden_dirs);
  c.scan.exclude_patterns =
      j.value("exclude_patterns", c.scan.exclude_patterns);
  j.at("photo_extensions").get_to(c.scan.photo_extensions);
  j.at("video_extensions").get_to(c.scan.video_extensions);
  c.transfer_mode = j.value("transfer_mode", c.transfer_mode);
  if (j.contains("parallel_processing")) {
    j.at("parallel_processing").get_to(c.parallel);
  }
  if (j.contains("performance")) {
    j.at("performance").get_to(c.performance);
  }
  if (j.contains("database_config")) {
    j.at("database_config").get_to(c.database_config);
  }
}

// Session snapshot: the settings that shaped one run.
inline void to_json(json& j, const Config& c) {
  j = json{{"source", c.source},
           {"destination", c.destination},
           {"scan", c.scan},
           {"transfer_mode", c.transfer_mode},
           {"parallel_processing", c.parallel},
           {"performance", c.performance},
           {"dry_run", c.dry_run}};
}

// --- Records -------------------------------------------------------------

struct FileRecord {
  std::int64_t id = 0;
  std::string hash;
  fs::path source_path;
  fs::path dest_path;  // relative to the destination root
  MediaType media_type = MediaType::UNKNOWN;
  std::optional<CaptureDate> capture_date;
  FileStatus status = FileStatus::ERROR;
  std::optional<std::int64_t> canonical_id;
  std::int64_t session_id = 0;
  std::string created_at;
  std::string detail;
};

struct SessionCounters {
  std::uint64_t seen = 0;
  std::uint64_t organized = 0;
  std::uint64_t duplicate = 0;
  std::uint64_t review = 0;
  std::uint64_t error = 0;
  std::uint64_t scan_errors = 0;

  bool operator==(const SessionCounters&) const = default;
};

enum class SessionState { RUNNING, COMPLETED, PARTIAL };

struct SessionInfo {
  std::int64_t id = 0;
  std::string started_at;
  std::string ended_at;
  std::string config_snapshot;
  SessionState state = SessionState::RUNNING;
  SessionCounters counters;
};

// --- Claim protocol ------------------------------------------------------

// What a worker asks the index to register as the first-seen copy.
struct ClaimRequest {
  std::string hash;
  MediaType media_type = MediaType::UNKNOWN;
  FileStatus status = FileStatus::ORGANIZED;  // ORGANIZED or REVIEW
  fs::path source_path;
  fs::path destination;  // relative
  std::optional<CaptureDate> capture_date;
};

struct ClaimWon {
  std::int64_t record_id = 0;
  fs::path destination;  // as granted, may carry a hash suffix
};

struct ClaimLost {
  std::int64_t canonical_id = 0;
  fs::path destination;
  fs::path source_path;
};

using ClaimResult = std::variant<ClaimWon, ClaimLost>;
