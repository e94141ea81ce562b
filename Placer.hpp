#pragma once

#include <string>

#include "ContentHasher.hpp"
#include "errors.hpp"
#include "types.hpp"

enum class PlacementOutcome { WRITTEN, ALREADY_PRESENT, SIMULATED };

enum class CollisionPolicy {
  EXACT,    // the destination was granted by the index; occupied = failure
  RESOLVE,  // fall back to the hash-suffixed name on collision
};

struct Placement {
  fs::path relative_path;
  PlacementOutcome outcome = PlacementOutcome::WRITTEN;
  bool collision = false;  // the requested name was taken by other bytes
};

// Copies or moves a source file into the archive tree without ever
// overwriting. In dry-run mode every decision is computed from read-only
// probes and nothing on disk changes.
class Placer {
 public:
  Placer(fs::path destination_root, TransferMode mode, bool dry_run,
         const ContentHasher& hasher);

  // Read-only: the first of `relative`, its 12-char hash-suffixed name and
  // its full-hash name that is free or already holds these bytes.
  fs::path resolve(const fs::path& relative, const std::string& hash) const;

  // Read-only: whether `relative` already holds these bytes.
  bool holds(const fs::path& relative, const std::string& hash) const {
    return probe(relative, hash) == Slot::SAME_CONTENT;
  }

  // Throws PlacementError. A failed transfer leaves no partial file at the
  // destination and, for moves, the source in place.
  Placement place(const fs::path& source, const fs::path& relative,
                  const std::string& hash, CollisionPolicy policy) const;

  bool dry_run() const { return m_dry_run; }
  const fs::path& destination_root() const { return m_root; }

 private:
  enum class Slot { FREE, SAME_CONTENT, TAKEN };

  Slot probe(const fs::path& relative, const std::string& hash) const;
  PlacementError occupied(const fs::path& relative) const;
  Placement already_present(const fs::path& source, const fs::path& name,
                            bool collision) const;

  fs::path stage(const fs::path& source, const fs::path& dir,
                 const fs::path& relative) const;
  // False when `target` appeared between the probe and the link.
  bool publish(const fs::path& staged, const fs::path& target) const;
  void unstage(const fs::path& staged, const fs::path& source) const;
  void remove_source(const fs::path& source, const fs::path& staged) const;

  fs::path m_root;
  TransferMode m_mode;
  bool m_dry_run;
  const ContentHasher& m_hasher;
};
