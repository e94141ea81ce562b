#pragma once

#include <optional>
#include <string_view>

#include "types.hpp"

enum class Category { ORGANIZED, REVIEW, DUPLICATE };

struct Classification {
  Category category = Category::REVIEW;
  fs::path relative_path;

  bool operator==(const Classification&) const = default;
};

// Destination layout, relative to the archive root:
//   PHOTO/2023/04/<name>          dated, first seen
//   ToReview/PHOTO/<name>         no capture date
//   PHOTO_DUPLICATES/<name>       bytes already archived
// Pure: no I/O, no state.
namespace Classifier {
inline constexpr std::string_view REVIEW_DIR = "ToReview";
inline constexpr std::string_view DUPLICATES_SUFFIX = "_DUPLICATES";

std::string_view media_folder(MediaType type);

Classification classify(MediaType type,
                        const std::optional<CaptureDate>& capture_date,
                        const ClaimResult& claim, const fs::path& file_name);

// Status a first-seen copy is claimed under: ORGANIZED when dated, REVIEW
// otherwise.
FileStatus canonical_status(const std::optional<CaptureDate>& capture_date);

// Every top-level folder the layout above can create.
std::vector<std::string> archive_folders();
}  // namespace Classifier
