#include "DateResolver.hpp"

#include <charconv>
#include <exiv2/exiv2.hpp>
#include <format>
#include <mutex>
#include <regex>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
std::mutex g_exiv2_mutex;

bool parse_int(std::string_view text, int& out) {
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, out);
  return ec == std::errc() && ptr == end;
}

bool plausible(int year, int month) {
  return year >= 1900 && year <= 2099 && month >= 1 && month <= 12;
}
}  // namespace

std::optional<CaptureDate> MediaDateResolver::resolve(
    const fs::path& path) const {
  if (auto exif = get_exif_date(path)) {
    return exif;
  }
  return date_from_filename(path);
}

// "YYYY:MM:DD HH:MM:SS", the EXIF DateTime layout.
std::optional<CaptureDate> MediaDateResolver::date_from_exif_string(
    std::string_view text) {
  if (text.length() < 7) return std::nullopt;
  int year = 0;
  int month = 0;
  if (!parse_int(text.substr(0, 4), year) ||
      !parse_int(text.substr(5, 2), month)) {
    return std::nullopt;
  }
  if (!plausible(year, month)) return std::nullopt;
  return CaptureDate{year, month};
}

std::optional<CaptureDate> MediaDateResolver::date_from_filename(
    const fs::path& path) {
  static const std::regex stamp(
      R"((?:^|[^0-9])((?:19|20)[0-9]{2})([-_.]?)(0[1-9]|1[0-2])\2(0[1-9]|[12][0-9]|3[01]))");

  const std::string stem = safe_path_to_string(path.stem());
  std::smatch match;
  if (!std::regex_search(stem, match, stamp)) return std::nullopt;

  int year = 0;
  int month = 0;
  if (!parse_int(match[1].str(), year) || !parse_int(match[3].str(), month)) {
    return std::nullopt;
  }
  return CaptureDate{year, month};
}

std::optional<CaptureDate> MediaDateResolver::get_exif_date(
    const fs::path& path) const {
  std::scoped_lock lock(g_exiv2_mutex);

  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(safe_path_to_string(path));
    if (!image.get()) return std::nullopt;
    image->readMetadata();
    const auto& exifData = image->exifData();
    if (exifData.empty()) return std::nullopt;

    for (const char* key : {"Exif.Photo.DateTimeOriginal", "Exif.Image.DateTime"}) {
      auto datum = exifData.findKey(Exiv2::ExifKey(key));
      if (datum != exifData.end() && datum->count() > 0) {
        if (auto date = date_from_exif_string(datum->toString())) {
          return date;
        }
      }
    }
  } catch (const Exiv2::Error& e) {
    IOManager::log(std::format("Non-critical Exiv2 error reading '{}': {}",
                               safe_path_to_string(path), e.what()));
  } catch (const std::exception& e) {
    IOManager::log(
        std::format("Non-critical standard exception reading '{}': {}",
                    safe_path_to_string(path), e.what()));
  }
  return std::nullopt;
}
