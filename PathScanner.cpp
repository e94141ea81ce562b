#include "PathScanner.hpp"

#include <format>
#include <system_error>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
std::unordered_set<std::string> lowered(const std::vector<std::string>& exts) {
  std::unordered_set<std::string> result;
  for (const auto& ext : exts) {
    std::string e = string_to_lower_ascii(ext);
    if (!e.empty() && e.front() != '.') e.insert(e.begin(), '.');
    result.insert(std::move(e));
  }
  return result;
}
}  // namespace

PathScanner::PathScanner(fs::path root, const ScanConfig& config)
    : m_root(std::move(root)),
      m_exclude_hidden_dirs(config.exclude_hidden_dirs),
      m_exclude_patterns(config.exclude_patterns),
      m_photo_extensions(lowered(config.photo_extensions)),
      m_video_extensions(lowered(config.video_extensions)) {}

void PathScanner::restart() {
  m_it.reset();
  m_finished = false;
  m_stats = {};
}

MediaType PathScanner::media_type_for(const fs::path& path) const {
  const std::string ext =
      string_to_lower_ascii(safe_path_to_string(path.extension()));
  if (m_photo_extensions.contains(ext)) return MediaType::PHOTO;
  if (m_video_extensions.contains(ext)) return MediaType::VIDEO;
  return MediaType::UNKNOWN;
}

bool PathScanner::is_excluded_name(const std::string& name) const {
  for (const auto& pattern : m_exclude_patterns) {
    if (!pattern.empty() && name.find(pattern) != std::string::npos) {
      return true;
    }
  }
  return false;
}

void PathScanner::record_scan_error(const fs::path& path,
                                    const std::error_code& ec) {
  ++m_stats.scan_errors;
  IOManager::log(std::format("[SCAN] Skipping '{}': {}",
                             safe_path_to_string(path), ec.message()));
}

std::optional<CandidatePath> PathScanner::next() {
  if (m_finished) return std::nullopt;

  std::error_code ec;
  if (!m_it) {
    m_it.emplace(m_root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      record_scan_error(m_root, ec);
      m_finished = true;
      return std::nullopt;
    }
  } else {
    m_it->increment(ec);
    if (ec) {
      record_scan_error(m_root, ec);
      m_finished = true;
      return std::nullopt;
    }
  }

  for (; *m_it != fs::recursive_directory_iterator(); m_it->increment(ec)) {
    if (ec) {
      record_scan_error(m_root, ec);
      break;
    }
    const fs::directory_entry& entry = **m_it;
    const std::string name = safe_path_to_string(entry.path().filename());

    std::error_code status_ec;
    if (entry.is_symlink(status_ec)) {
      std::error_code exists_ec;
      if (!fs::exists(entry.path(), exists_ec)) {
        record_scan_error(entry.path(),
                          std::make_error_code(std::errc::no_such_file_or_directory));
      } else {
        ++m_stats.skipped_files;
      }
      continue;
    }

    if (entry.is_directory(status_ec)) {
      if ((m_exclude_hidden_dirs && name.starts_with('.')) ||
          is_excluded_name(name)) {
        ++m_stats.skipped_dirs;
        m_it->disable_recursion_pending();
      }
      continue;
    }

    if (!entry.is_regular_file(status_ec)) {
      if (status_ec) {
        record_scan_error(entry.path(), status_ec);
      } else {
        ++m_stats.skipped_files;
      }
      continue;
    }

    if (is_excluded_name(name)) {
      ++m_stats.skipped_files;
      continue;
    }

    const MediaType type = media_type_for(entry.path());
    if (type == MediaType::UNKNOWN) {
      ++m_stats.unsupported_files;
      continue;
    }

    ++m_stats.candidates;
    return CandidatePath{fs::absolute(entry.path()), type};
  }

  m_finished = true;
  return std::nullopt;
}
