#include "IOManager.hpp"

#include <chrono>
#include <fstream>
#include <functional>
#include <istream>
#include <mutex>
#include <ostream>
#include <print>
#include <string>

#include "Classifier.hpp"
#include "DuplicateIndex.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace {
struct LogState {
  std::ofstream stream;
  fs::path path;
};

LogState& get_log_state() {
  static LogState state;
  return state;
}

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

std::string csv_field(std::string_view value) {
  if (value.find_first_of(",\"\n") == std::string_view::npos) {
    return std::string(value);
  }
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

bool remove_path(const fs::path& path, std::ostream& out) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    std::println(out, "Not found (already removed?): {}",
                 safe_path_to_string(path));
    return true;
  }
  fs::remove_all(path, ec);
  if (ec) {
    std::println(out, "Error removing '{}': {}", safe_path_to_string(path),
                 ec.message());
    IOManager::log(std::format("[RESET] Error removing '{}': {}",
                               safe_path_to_string(path), ec.message()));
    return false;
  }
  std::println(out, "Removed: {}", safe_path_to_string(path));
  return true;
}
}  // namespace

void IOManager::initialize_logger(const fs::path& log_path) {
  std::scoped_lock lock(log_mutex);
  auto& state = get_log_state();
  if (state.stream.is_open()) state.stream.close();
  state.path = log_path;
  if (log_path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(log_path.parent_path(), ec);
  }
  state.stream.open(log_path, std::ios_base::app);
}

void IOManager::close_logger() {
  std::scoped_lock lock(log_mutex);
  auto& state = get_log_state();
  if (state.stream.is_open()) state.stream.close();
}

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::log(std::string_view message) {
  std::scoped_lock lock(log_mutex);

  std::string full_message = std::format(
      "{} | {}", format_timestamp(std::chrono::system_clock::now()), message);

  if (g_log_handler) {
    g_log_handler(full_message);
  }

  auto& log_stream = get_log_state().stream;
  if (log_stream.is_open()) {
    log_stream << full_message << "\n" << std::flush;
  }
}

std::optional<Config> IOManager::load_config(const fs::path& configPath) {
  if (!fs::exists(configPath)) {
    log(std::format("Error: Config file not found at {}",
                    safe_path_to_string(configPath)));
    return std::nullopt;
  }
  std::ifstream configFile(configPath);
  try {
    json configJson = json::parse(configFile);
    Config config = configJson.get<Config>();
    for (auto* list :
         {&config.scan.photo_extensions, &config.scan.video_extensions}) {
      for (auto& ext : *list) {
        ext = string_to_lower_ascii(ext);
        if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
      }
    }
    return config;
  } catch (const json::exception& e) {
    log(std::format("Error parsing {}: {}", safe_path_to_string(configPath),
                    e.what()));
    return std::nullopt;
  }
}

void IOManager::validate_config(const Config& config) {
  if (config.source.empty() || config.destination.empty()) {
    throw ConfigError("Both 'source' and 'destination' must be set");
  }
  if (config.scan.photo_extensions.empty() &&
      config.scan.video_extensions.empty()) {
    throw ConfigError("No photo or video extensions configured");
  }
  if (config.performance.buffer_size == 0) {
    throw ConfigError("'performance.buffer_size' must be positive");
  }
  if (config.parallel.cpu_multiplier < 1 ||
      config.parallel.max_workers_limit < 1 ||
      (config.parallel.max_workers && *config.parallel.max_workers < 1)) {
    throw ConfigError("Worker pool sizing values must be at least 1");
  }

  std::error_code ec;
  const fs::path source = config.source;
  if (!fs::exists(source, ec)) {
    throw ConfigError(std::format("Source directory not found: {}",
                                  safe_path_to_string(source)));
  }
  if (!fs::is_directory(source, ec)) {
    throw ConfigError(std::format("Source is not a directory: {}",
                                  safe_path_to_string(source)));
  }
  fs::directory_iterator probe(source, ec);
  if (ec) {
    throw ConfigError(std::format("Cannot read source directory '{}': {}",
                                  safe_path_to_string(source), ec.message()));
  }

  const fs::path source_abs = resolved_path(config.source);
  const fs::path dest_abs = resolved_path(config.destination);
  if (source_abs == dest_abs) {
    throw ConfigError(std::format(
        "Source and destination resolve to the same directory: {}",
        safe_path_to_string(source_abs)));
  }
  if (is_same_or_nested(source_abs, dest_abs)) {
    throw ConfigError(std::format("Destination '{}' is inside source '{}'",
                                  safe_path_to_string(dest_abs),
                                  safe_path_to_string(source_abs)));
  }
  if (is_same_or_nested(dest_abs, source_abs)) {
    throw ConfigError(std::format("Source '{}' is inside destination '{}'",
                                  safe_path_to_string(source_abs),
                                  safe_path_to_string(dest_abs)));
  }

  if (fs::exists(config.destination, ec)) {
    if (!fs::is_directory(config.destination, ec)) {
      throw ConfigError(
          std::format("Destination exists but is not a directory: {}",
                      safe_path_to_string(config.destination)));
    }
    if (!config.dry_run) {
      const fs::path probe_file = config.destination / ".media-archiver-write-probe";
      {
        std::ofstream touch(probe_file);
        if (!touch) {
          throw ConfigError(std::format("Destination is not writable: {}",
                                        safe_path_to_string(config.destination)));
        }
      }
      fs::remove(probe_file, ec);
    }
  }
}

void IOManager::prepare_destination(const Config& config) {
  if (config.dry_run) return;
  std::error_code ec;
  if (fs::exists(config.destination, ec)) return;
  fs::create_directories(config.destination, ec);
  if (ec) {
    throw ConfigError(std::format("Cannot create destination '{}': {}",
                                  safe_path_to_string(config.destination),
                                  ec.message()));
  }
  log(std::format("[DIR] Created destination directory: '{}'",
                  safe_path_to_string(config.destination)));
}

bool IOManager::reset_environment(const Config& config, bool assume_yes,
                                  std::istream& in, std::ostream& out) {
  std::vector<fs::path> targets = {config.database,
                                   fs::path(config.database) += "-wal",
                                   fs::path(config.database) += "-shm",
                                   config.log};
  for (const auto& folder : Classifier::archive_folders()) {
    targets.push_back(config.destination / folder);
  }

  std::println(out, "WARNING: environment reset");
  std::println(out, "This will delete:");
  for (const auto& target : targets) {
    std::println(out, "  - {}", safe_path_to_string(target));
  }

  if (!assume_yes) {
    std::print(out, "Are you sure you want to continue? [y/N]: ");
    out.flush();
    std::string answer;
    std::getline(in, answer);
    answer = string_to_lower_ascii(answer);
    if (answer != "y" && answer != "s" && answer != "yes") {
      std::println(out, "Reset cancelled.");
      return false;
    }
  }

  // The log file is among the targets; reopen it fresh afterwards.
  close_logger();
  bool success = true;
  for (const auto& target : targets) {
    success = remove_path(target, out) && success;
  }
  initialize_logger(config.log);
  if (success) {
    log("[RESET] Environment reset complete");
    std::println(out, "Reset complete.");
  } else {
    log("[RESET] Environment reset finished with errors");
    std::println(out, "Reset finished with errors, see above.");
  }
  return success;
}

void IOManager::export_report(DuplicateIndex& index,
                              const fs::path& output_path) {
  std::ofstream csv(output_path);
  if (!csv) {
    throw IOError(std::format("Cannot write report '{}'",
                              safe_path_to_string(output_path)));
  }
  csv << "source_path,hash,year,month,media_type,status,dest_path,session_id,"
         "created_at,detail\n";
  std::size_t rows = 0;
  for (const auto& record : index.all_records()) {
    csv << csv_field(safe_path_to_string(record.source_path)) << ','
        << record.hash << ','
        << (record.capture_date ? std::to_string(record.capture_date->year) : "")
        << ','
        << (record.capture_date ? std::format("{:02}", record.capture_date->month)
                                : "")
        << ',' << to_string(record.media_type) << ','
        << to_string(record.status) << ','
        << csv_field(safe_path_to_string(record.dest_path)) << ','
        << record.session_id << ',' << record.created_at << ','
        << csv_field(record.detail) << '\n';
    ++rows;
  }
  log(std::format("Report exported: {} ({} records)",
                  safe_path_to_string(output_path), rows));
}
