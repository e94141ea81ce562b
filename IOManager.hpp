#pragma once

#include <functional>
#include <iosfwd>
#include <optional>

#include "types.hpp"

class DuplicateIndex;

namespace IOManager {
// Opens (or reopens) the log file. Until this is called log lines only go
// to the handler.
void initialize_logger(const fs::path& log_path);
void close_logger();

void set_log_handler(std::function<void(std::string_view)> handler);

void log(std::string_view message);

std::optional<Config> load_config(const fs::path& configPath);

// Pre-run safety checks. Throws ConfigError naming the violation; touches
// nothing on disk apart from a write probe in the destination (real runs
// only).
void validate_config(const Config& config);

// Creates the destination root for real runs. Throws ConfigError.
void prepare_destination(const Config& config);

// Removes the database (and its WAL/SHM files), the log and every archive
// folder under the destination. Asks on `in`/`out` unless `assume_yes`.
// Returns false when the user declined or something could not be removed.
bool reset_environment(const Config& config, bool assume_yes,
                       std::istream& in, std::ostream& out);

// Every FileRecord in the store as CSV.
void export_report(DuplicateIndex& index, const fs::path& output_path);
}  // namespace IOManager
