#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "types.hpp"

// Streams a file through an OpenSSL digest with a bounded read buffer, so
// memory use does not grow with file size. Safe to share between workers:
// every call owns its own buffer and digest context.
class ContentHasher {
 public:
  using Deadline = std::optional<std::chrono::steady_clock::time_point>;

  explicit ContentHasher(std::size_t buffer_size = 64 * 1024,
                         std::string algorithm = "sha256");

  // Lowercase hex digest of the file's bytes. Throws IOError when the file
  // cannot be opened or a read fails, FileTimeoutError once `deadline` has
  // passed between two chunks.
  std::string hash_file(const fs::path& path,
                        const Deadline& deadline = std::nullopt) const;

  // True when `path` is a regular file holding exactly the bytes that hash
  // to `hash`. Unreadable files compare unequal.
  bool has_content(const fs::path& path, const std::string& hash) const;

  std::size_t buffer_size() const { return m_buffer_size; }
  const std::string& algorithm() const { return m_algorithm; }

 private:
  std::size_t m_buffer_size;
  std::string m_algorithm;
};
