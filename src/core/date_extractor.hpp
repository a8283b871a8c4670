/**
 * @file    date_extractor.hpp
 * @brief   Capture-date extraction from EXIF / XMP metadata
 * @license MIT
 *
 * @details
 * Probe order (first non-empty value wins):
 *   1. Exif.Photo.DateTimeOriginal   (EXIF tag 36867)
 *   2. Exif.Image.DateTime           (EXIF tag 306)
 *   3. Xmp.exif.DateTimeOriginal     (XMP packet, only if EXIF had neither)
 *   4. Xmp.tiff.DateTime
 *
 * The winning value is reduced to its date part and normalized to YYYY-MM-DD.
 * A missing or unparseable date is an expected outcome (std::nullopt).
 */

#pragma once

#include "core/source_image.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pdm {

enum class MetadataSource {
    Exif,
    Xmp
};

struct DateTagProbe {
    MetadataSource source;
    const char* key;
};

/**
 * Ordered list of tags consulted by extract_capture_date()
 */
[[nodiscard]] const std::vector<DateTagProbe>& capture_date_probes();

/**
 * Normalize a metadata timestamp to YYYY-MM-DD.
 *
 *   "2023:07:04 10:11:12"  ->  "2023-07-04"
 *   "2023-07-04 10:11:12"  ->  "2023-07-04"
 *   "2023-07-04T10:11:12"  ->  "2023-07-04"   (XMP)
 *   "0000:00:00 00:00:00"  ->  nullopt
 */
[[nodiscard]] std::optional<std::string> normalize_capture_date(std::string_view raw);

/**
 * Extract the capture date from metadata held in an encoded image buffer.
 *
 * Never throws for missing or broken metadata; returns std::nullopt.
 */
[[nodiscard]] std::optional<std::string> extract_capture_date(
    const std::vector<unsigned char>& encoded
);

[[nodiscard]] std::optional<std::string> extract_capture_date(const SourceImage& image);

/**
 * Route Exiv2 diagnostics into spdlog. Idempotent.
 */
void install_exiv2_log_forwarding();

}  // namespace pdm
