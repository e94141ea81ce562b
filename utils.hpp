#pragma once

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

// A central, thread-safe utility to convert a std::filesystem::path to a
// UTF-8 encoded std::string, suitable for logging and storage.
inline std::string safe_path_to_string(const fs::path& p) {
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

inline fs::path path_from_utf8(std::string_view text) {
  const std::string owned(text);
  return fs::path(reinterpret_cast<const char8_t*>(owned.c_str()));
}

// Lowercases ASCII only; extensions and keywords never need more.
inline std::string string_to_lower_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c + ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

// "IMG_0001.jpg" + "3fa9..." -> "IMG_0001~3fa9c2d41b07.jpg". A length of
// std::string::npos appends the whole hash.
inline fs::path hash_suffixed_path(const fs::path& path, std::string_view hash,
                                   std::size_t length = 12) {
  const std::string stem = safe_path_to_string(path.stem());
  const std::string ext = safe_path_to_string(path.extension());
  const std::string name =
      std::format("{}~{}{}", stem, hash.substr(0, length), ext);
  return path.parent_path() / path_from_utf8(name);
}

// Absolute, normalized form used for the source/destination safety checks.
// Works for paths that do not exist yet.
inline fs::path resolved_path(const fs::path& p) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(fs::absolute(p, ec), ec);
  if (ec) {
    resolved = fs::absolute(p).lexically_normal();
  }
  // "/a/b/" -> "/a/b"
  if (!resolved.has_filename() && resolved != resolved.root_path()) {
    resolved = resolved.parent_path();
  }
  return resolved;
}

// True when `inner` is `outer` itself or lives somewhere below it.
inline bool is_same_or_nested(const fs::path& outer, const fs::path& inner) {
  const fs::path a = resolved_path(outer);
  const fs::path b = resolved_path(inner);
  auto [a_it, b_it] = std::mismatch(a.begin(), a.end(), b.begin(), b.end());
  return a_it == a.end();
}

inline std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  return std::format("{:%Y-%m-%d %H:%M:%S}",
                     std::chrono::floor<std::chrono::seconds>(tp));
}
