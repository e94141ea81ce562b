#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>

#include "types.hpp"

struct ScanStats {
  std::size_t candidates = 0;
  std::size_t skipped_dirs = 0;
  std::size_t skipped_files = 0;
  std::size_t unsupported_files = 0;
  std::size_t scan_errors = 0;
};

// Depth-first walk of the source tree that yields one CandidatePath at a
// time. Hidden and pattern-excluded directories are pruned, files are kept
// only when their extension belongs to a configured media type. Symlinks are
// never followed; broken ones count as scan errors.
class PathScanner {
 public:
  PathScanner(fs::path root, const ScanConfig& config);

  std::optional<CandidatePath> next();

  // Starts the walk over from the root and resets the statistics.
  void restart();

  const ScanStats& stats() const { return m_stats; }

  MediaType media_type_for(const fs::path& path) const;

 private:
  bool is_excluded_name(const std::string& name) const;
  void record_scan_error(const fs::path& path, const std::error_code& ec);

  fs::path m_root;
  bool m_exclude_hidden_dirs;
  std::vector<std::string> m_exclude_patterns;
  std::unordered_set<std::string> m_photo_extensions;
  std::unordered_set<std::string> m_video_extensions;

  std::optional<fs::recursive_directory_iterator> m_it;
  bool m_finished = false;
  ScanStats m_stats;
};
