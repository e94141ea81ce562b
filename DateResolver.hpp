#pragma once

#include <optional>

#include "types.hpp"

// Capture date lookup consumed by the pipeline. Implementations never throw:
// a missing or corrupt date degrades to std::nullopt.
class DateResolver {
 public:
  virtual ~DateResolver() = default;

  virtual std::optional<CaptureDate> resolve(const fs::path& path) const = 0;
};

// EXIF (via Exiv2) first, then a date stamp embedded in the file name
// ("IMG_20230401_1200.jpg", "VID-2019-07-14.mp4").
class MediaDateResolver : public DateResolver {
 public:
  std::optional<CaptureDate> resolve(const fs::path& path) const override;

  static std::optional<CaptureDate> date_from_exif_string(std::string_view text);
  static std::optional<CaptureDate> date_from_filename(const fs::path& path);

 private:
  std::optional<CaptureDate> get_exif_date(const fs::path& path) const;
};
