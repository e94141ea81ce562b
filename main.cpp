#include <exception>
#include <exiv2/exiv2.hpp>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <print>
#include <string_view>
#include <vector>

#include "Dashboard.hpp"
#include "DateResolver.hpp"
#include "DuplicateIndex.hpp"
#include "IOManager.hpp"
#include "IngestPipeline.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace {
struct CliOptions {
  bool dry_run = false;
  bool reset = false;
  bool assume_yes = false;
  bool headless = false;
  bool help = false;
  std::optional<fs::path> config_path;
  std::optional<fs::path> report_path;
};

void print_usage(std::FILE* stream) {
  std::println(stream, "Usage: media-archiver [options]");
  std::println(stream, "  --dry-run              simulate; nothing is written");
  std::println(stream, "  --reset                delete the database, log and archive folders");
  std::println(stream, "  --yes                  do not ask before --reset");
  std::println(stream, "  --headless             no dashboard, log lines on stdout");
  std::println(stream, "  --config <path>        use this config.json");
  std::println(stream, "  --export-report <csv>  write every record as CSV after the run");
  std::println(stream, "  --help                 show this help");
}

// Throws ConfigError on an unknown flag or a missing value.
CliOptions parse_arguments(int argc, char* argv[]) {
  CliOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--dry-run") {
      options.dry_run = true;
    } else if (arg == "--reset") {
      options.reset = true;
    } else if (arg == "--yes" || arg == "-y") {
      options.assume_yes = true;
    } else if (arg == "--headless") {
      options.headless = true;
    } else if (arg == "--help" || arg == "-h") {
      options.help = true;
    } else if (arg == "--config" || arg == "--export-report") {
      if (i + 1 >= argc) {
        throw ConfigError(std::format("Missing value for {}", arg));
      }
      fs::path value = path_from_utf8(argv[++i]);
      if (arg == "--config") {
        options.config_path = std::move(value);
      } else {
        options.report_path = std::move(value);
      }
    } else {
      throw ConfigError(std::format("Unknown argument: {}", arg));
    }
  }
  return options;
}

std::optional<Config> find_config(const CliOptions& options,
                                  const char* argv0,
                                  std::vector<fs::path>& searched) {
  if (options.config_path) {
    searched.push_back(*options.config_path);
    return IOManager::load_config(*options.config_path);
  }

  fs::path exePath = argv0 ? fs::path(argv0).parent_path() : fs::path();
  if (exePath.empty()) {
    exePath = fs::current_path();
  }
  searched = {exePath / "config.json", fs::current_path() / "config.json",
              exePath.parent_path() / "config.json"};
  for (const auto& configPath : searched) {
    if (fs::exists(configPath)) {
      if (auto config = IOManager::load_config(configPath)) return config;
    }
  }
  return std::nullopt;
}

void print_summary(const RunSummary& summary, const StoreStatistics& stats,
                   bool dry_run) {
  const SessionCounters& c = summary.counters;
  std::println("");
  std::println("=== Session {} {}{} ===", summary.session_id,
               summary.completed ? "completed" : "partial",
               dry_run ? " (dry run)" : "");
  std::println("  workers     : {}", summary.workers);
  std::println("  seen        : {}", c.seen);
  std::println("  organized   : {}", c.organized);
  std::println("  duplicate   : {}", c.duplicate);
  std::println("  review      : {}", c.review);
  std::println("  error       : {}", c.error);
  std::println("  scan errors : {}", c.scan_errors);

  std::println("");
  std::println("Store statistics");
  for (const auto& [status, count] : stats.by_status) {
    std::println("  {:<10} {}", to_string(status), count);
  }
  for (const auto& [type, count] : stats.by_media) {
    std::println("  {:<10} {}", to_string(type), count);
  }
  for (const auto& [year, count] : stats.by_year) {
    std::println("  {:<10} {}", year, count);
  }
}

int run_application(const CliOptions& options, char* argv0) {
  // Until the log file is known, problems go to stderr.
  IOManager::set_log_handler(
      [](std::string_view message) { std::println(stderr, "{}", message); });
  std::vector<fs::path> searched;
  std::optional<Config> configOpt = find_config(options, argv0, searched);
  IOManager::set_log_handler(nullptr);

  if (!configOpt) {
    std::println(stderr, "\n=== ERROR ===");
    std::println(stderr, "Failed to load config.json!\n");
    std::println(stderr, "Searched in:");
    for (const auto& path : searched) {
      std::println(stderr, "  - {}", safe_path_to_string(path));
    }
    return 1;
  }
  Config config = std::move(*configOpt);
  config.dry_run = options.dry_run;

  if (options.reset) {
    IOManager::initialize_logger(config.log);
    const bool reset = IOManager::reset_environment(config, options.assume_yes,
                                                    std::cin, std::cout);
    return reset ? 0 : 1;
  }

  IOManager::validate_config(config);
  IOManager::initialize_logger(config.log);
  IOManager::log("--- Media Archiver Started ---");
  IOManager::prepare_destination(config);

  DuplicateIndex index(
      config.dry_run ? fs::path(DuplicateIndex::IN_MEMORY) : config.database,
      config.database_config);
  MediaDateResolver date_resolver;
  IngestPipeline pipeline(config, index, date_resolver);

  RunSummary summary;
  if (options.headless) {
    IOManager::set_log_handler(
        [](std::string_view message) { std::println("{}", message); });
    summary = pipeline.run();
    IOManager::set_log_handler(nullptr);
  } else {
    auto dashboard = std::make_shared<Dashboard>(pipeline, config);
    summary = dashboard->run();
  }

  print_summary(summary, index.statistics(), config.dry_run);

  if (options.report_path) {
    IOManager::export_report(index, *options.report_path);
    std::println("Report written to {}",
                 safe_path_to_string(*options.report_path));
  }

  IOManager::log("--- Media Archiver Exited Normally ---");
  return 0;
}
}  // namespace

int main(int argc, char* argv[]) {
  Exiv2::XmpParser::initialize();

  int exit_code = 1;
  try {
    const CliOptions options = parse_arguments(argc, argv);
    if (options.help) {
      print_usage(stdout);
      exit_code = 0;
    } else {
      exit_code = run_application(options, argc > 0 ? argv[0] : nullptr);
    }
  } catch (const ConfigError& e) {
    IOManager::log(std::format("CONFIG ERROR: {}", e.what()));
    std::println(stderr, "\n=== ERROR ===");
    std::println(stderr, "{}", e.what());
  } catch (const std::exception& e) {
    IOManager::log(std::format("FATAL EXCEPTION: {}", e.what()));
    std::println(stderr, "\n=== FATAL ERROR ===");
    std::println(stderr, "Exception: {}", e.what());
    std::println(stderr, "Check the log file for details.");
  }

  IOManager::close_logger();
  Exiv2::XmpParser::terminate();
  return exit_code;
}
