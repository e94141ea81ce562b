#include "ContentHasher.hpp"

#include <openssl/evp.h>

#include <format>
#include <fstream>
#include <memory>
#include <vector>

#include "errors.hpp"
#include "utils.hpp"

namespace {
using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

const EVP_MD* lookup_digest(const std::string& name) {
  const EVP_MD* md = EVP_get_digestbyname(name.c_str());
  if (md == nullptr) {
    throw ConfigError(std::format("Unknown hash algorithm '{}'", name));
  }
  return md;
}
}  // namespace

ContentHasher::ContentHasher(std::size_t buffer_size, std::string algorithm)
    : m_buffer_size(buffer_size == 0 ? 64 * 1024 : buffer_size),
      m_algorithm(string_to_lower_ascii(algorithm)) {
  lookup_digest(m_algorithm);
}

std::string ContentHasher::hash_file(const fs::path& path,
                                     const Deadline& deadline) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw IOError(
        std::format("Cannot open '{}' for hashing", safe_path_to_string(path)));
  }

  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), lookup_digest(m_algorithm),
                                nullptr) != 1) {
    throw IOError("Failed to initialise digest context");
  }

  std::vector<char> buffer(m_buffer_size);
  while (file) {
    if (deadline && std::chrono::steady_clock::now() > *deadline) {
      throw FileTimeoutError(std::format("Hashing '{}' exceeded its time limit",
                                         safe_path_to_string(path)));
    }
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize got = file.gcount();
    if (file.bad()) {
      throw IOError(std::format("Read failed while hashing '{}'",
                                safe_path_to_string(path)));
    }
    if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(),
                                    static_cast<std::size_t>(got)) != 1) {
      throw IOError(std::format("Digest update failed for '{}'",
                                safe_path_to_string(path)));
    }
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw IOError(std::format("Digest finalisation failed for '{}'",
                              safe_path_to_string(path)));
  }

  std::string hex;
  hex.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    hex += std::format("{:02x}", digest[i]);
  }
  return hex;
}

bool ContentHasher::has_content(const fs::path& path,
                                const std::string& hash) const {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) return false;
  try {
    return hash_file(path) == hash;
  } catch (const IOError&) {
    return false;
  }
}
