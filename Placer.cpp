#include "Placer.hpp"

#include <atomic>
#include <cstdint>
#include <format>
#include <functional>
#include <system_error>
#include <thread>
#include <vector>

#include "IOManager.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace {
std::vector<fs::path> candidate_names(const fs::path& relative,
                                      const std::string& hash,
                                      CollisionPolicy policy) {
  if (policy == CollisionPolicy::EXACT) return {relative};
  return {relative, hash_suffixed_path(relative, hash),
          hash_suffixed_path(relative, hash, std::string::npos)};
}

constexpr int kStageAttempts = 3;
constexpr int kPublishAttempts = 3;

std::atomic<std::uint64_t> g_stage_counter{0};

// Hidden and unique per call, next to the final name so it can be linked.
fs::path staging_name(const fs::path& dir, const fs::path& name) {
  const std::size_t thread_tag =
      std::hash<std::thread::id>{}(std::this_thread::get_id());
  return dir / path_from_utf8(std::format(".{}.{:x}-{}.partial",
                                          safe_path_to_string(name.filename()),
                                          thread_tag, ++g_stage_counter));
}

void discard(const fs::path& staged) {
  std::error_code ec;
  fs::remove(staged, ec);
  if (ec) {
    IOManager::log(std::format("[ERROR] Could not remove staging file '{}': {}",
                               safe_path_to_string(staged), ec.message()));
  }
}
}  // namespace

Placer::Placer(fs::path destination_root, TransferMode mode, bool dry_run,
               const ContentHasher& hasher)
    : m_root(std::move(destination_root)),
      m_mode(mode),
      m_dry_run(dry_run),
      m_hasher(hasher) {}

Placer::Slot Placer::probe(const fs::path& relative,
                           const std::string& hash) const {
  const fs::path target = m_root / relative;
  std::error_code ec;
  if (!fs::exists(fs::symlink_status(target, ec))) {
    return Slot::FREE;
  }
  return m_hasher.has_content(target, hash) ? Slot::SAME_CONTENT : Slot::TAKEN;
}

fs::path Placer::resolve(const fs::path& relative,
                         const std::string& hash) const {
  for (const auto& name :
       candidate_names(relative, hash, CollisionPolicy::RESOLVE)) {
    if (probe(name, hash) != Slot::TAKEN) return name;
  }
  throw PlacementError(std::format("No free name for '{}' in '{}'",
                                   safe_path_to_string(relative),
                                   safe_path_to_string(m_root)));
}

Placement Placer::place(const fs::path& source, const fs::path& relative,
                        const std::string& hash, CollisionPolicy policy) const {
  const auto names = candidate_names(relative, hash, policy);

  std::size_t i = 0;
  Slot slot = Slot::TAKEN;
  for (; i < names.size(); ++i) {
    slot = probe(names[i], hash);
    if (slot != Slot::TAKEN) break;
  }
  if (i == names.size()) throw occupied(relative);

  if (m_dry_run) {
    IOManager::log(std::format(
        "[DRY-RUN] Would {} '{}' -> '{}'{}",
        m_mode == TransferMode::MOVE ? "move" : "copy",
        safe_path_to_string(source), safe_path_to_string(names[i]),
        slot == Slot::SAME_CONTENT ? " (already present)" : ""));
    return {names[i],
            slot == Slot::SAME_CONTENT ? PlacementOutcome::ALREADY_PRESENT
                                       : PlacementOutcome::SIMULATED,
            i > 0};
  }

  if (slot == Slot::SAME_CONTENT) {
    if (m_mode == TransferMode::MOVE) remove_source(source, {});
    return already_present(source, names[i], i > 0);
  }

  const fs::path parent_dir = (m_root / relative).parent_path();
  std::error_code ec;
  fs::create_directories(parent_dir, ec);
  if (ec) {
    throw PlacementError(
        std::format("Failed to create directory '{}': {}",
                    safe_path_to_string(parent_dir), ec.message()));
  }

  // The bytes are written under a private name and then linked into place,
  // so a final name only ever appears complete and is never removed again.
  const fs::path staged = stage(source, parent_dir, relative);
  if (m_mode == TransferMode::MOVE) remove_source(source, staged);

  try {
    for (; i < names.size(); ++i) {
      for (int attempt = 0; attempt < kPublishAttempts; ++attempt) {
        slot = probe(names[i], hash);
        if (slot == Slot::TAKEN) break;
        if (slot == Slot::SAME_CONTENT) {
          discard(staged);
          return already_present(source, names[i], i > 0);
        }
        if (publish(staged, m_root / names[i])) {
          discard(staged);
          IOManager::log(std::format("[PLACE] '{}' -> '{}'",
                                     safe_path_to_string(source),
                                     safe_path_to_string(names[i])));
          return {names[i], PlacementOutcome::WRITTEN, i > 0};
        }
        // Someone else wrote this name since the probe; look again.
      }
    }
    throw occupied(relative);
  } catch (const PlacementError&) {
    unstage(staged, source);
    throw;
  }
}

PlacementError Placer::occupied(const fs::path& relative) const {
  return PlacementError(std::format(
      "Destination '{}' is occupied by different content",
      safe_path_to_string(m_root / relative)));
}

Placement Placer::already_present(const fs::path& source, const fs::path& name,
                                  bool collision) const {
  IOManager::log(std::format("[PLACE] '{}' already present at '{}'",
                             safe_path_to_string(source),
                             safe_path_to_string(name)));
  return {name, PlacementOutcome::ALREADY_PRESENT, collision};
}

fs::path Placer::stage(const fs::path& source, const fs::path& dir,
                       const fs::path& relative) const {
  for (int attempt = 0; attempt < kStageAttempts; ++attempt) {
    const fs::path staged = staging_name(dir, relative);
    std::error_code ec;
    if (m_mode == TransferMode::MOVE) {
      // Falls through to a copy across devices.
      fs::create_hard_link(source, staged, ec);
      if (!ec) return staged;
      if (ec == std::errc::file_exists) continue;
      ec.clear();
    }

    fs::copy_file(source, staged, fs::copy_options::none, ec);
    if (!ec) return staged;
    if (ec == std::errc::file_exists) continue;

    std::error_code cleanup_ec;
    fs::remove(staged, cleanup_ec);
    throw PlacementError(std::format("Failed to copy '{}' -> '{}': {}",
                                     safe_path_to_string(source),
                                     safe_path_to_string(dir), ec.message()));
  }
  throw PlacementError(std::format("No free staging name in '{}'",
                                   safe_path_to_string(dir)));
}

bool Placer::publish(const fs::path& staged, const fs::path& target) const {
  std::error_code ec;
  fs::create_hard_link(staged, target, ec);
  if (!ec) return true;
  if (ec == std::errc::file_exists) return false;

  // Filesystems without hard links.
  ec.clear();
  fs::copy_file(staged, target, fs::copy_options::none, ec);
  if (!ec) return true;
  if (ec == std::errc::file_exists) return false;

  std::error_code cleanup_ec;
  fs::remove(target, cleanup_ec);
  throw PlacementError(std::format("Failed to write '{}': {}",
                                   safe_path_to_string(target), ec.message()));
}

void Placer::unstage(const fs::path& staged, const fs::path& source) const {
  if (m_mode == TransferMode::COPY) {
    discard(staged);
    return;
  }

  // The source is already gone; put the bytes back where they came from.
  std::error_code ec;
  fs::rename(staged, source, ec);
  if (!ec) return;
  ec.clear();
  fs::copy_file(staged, source, fs::copy_options::none, ec);
  if (ec) {
    IOManager::log(std::format("[ERROR] Could not restore '{}', content kept at '{}': {}",
                               safe_path_to_string(source),
                               safe_path_to_string(staged), ec.message()));
    return;
  }
  discard(staged);
}

void Placer::remove_source(const fs::path& source,
                           const fs::path& staged) const {
  std::error_code ec;
  fs::remove(source, ec);
  if (!ec) return;

  if (!staged.empty()) discard(staged);
  throw PlacementError(std::format("Failed to remove source '{}' after transfer: {}",
                                   safe_path_to_string(source), ec.message()));
}
