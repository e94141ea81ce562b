#include "Classifier.hpp"

#include <format>

std::string_view Classifier::media_folder(MediaType type) {
  switch (type) {
    case MediaType::PHOTO:
      return "PHOTO";
    case MediaType::VIDEO:
      return "VIDEO";
    default:
      return "OTHER";
  }
}

Classification Classifier::classify(
    MediaType type, const std::optional<CaptureDate>& capture_date,
    const ClaimResult& claim, const fs::path& file_name) {
  const fs::path name = file_name.filename();
  const std::string_view folder = media_folder(type);

  if (std::holds_alternative<ClaimLost>(claim)) {
    return {Category::DUPLICATE,
            fs::path(std::format("{}{}", folder, DUPLICATES_SUFFIX)) / name};
  }
  if (capture_date) {
    return {Category::ORGANIZED,
            fs::path(folder) / std::format("{:04}", capture_date->year) /
                std::format("{:02}", capture_date->month) / name};
  }
  return {Category::REVIEW, fs::path(REVIEW_DIR) / folder / name};
}

FileStatus Classifier::canonical_status(
    const std::optional<CaptureDate>& capture_date) {
  return capture_date ? FileStatus::ORGANIZED : FileStatus::REVIEW;
}

std::vector<std::string> Classifier::archive_folders() {
  std::vector<std::string> folders;
  for (MediaType type : {MediaType::PHOTO, MediaType::VIDEO}) {
    folders.emplace_back(media_folder(type));
    folders.push_back(std::format("{}{}", media_folder(type), DUPLICATES_SUFFIX));
  }
  folders.emplace_back(REVIEW_DIR);
  return folders;
}
