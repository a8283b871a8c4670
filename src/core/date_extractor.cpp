/**
 * @file    date_extractor.cpp
 * @brief   Capture-date extraction (Exiv2)
 * @license MIT
 */

#include "core/date_extractor.hpp"

#include <exiv2/exiv2.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <array>
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <string_view>

namespace pdm {

namespace {

constexpr std::string_view kBlank = std::string_view(" \t\r\n\0", 5);

std::string_view trim(std::string_view s) {
    const auto first = s.find_first_not_of(kBlank);
    if (first == std::string_view::npos) return {};
    return s.substr(first, s.find_last_not_of(kBlank) - first + 1);
}

bool parse_number(std::string_view text, int& out) {
    if (text.empty()) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

// "YYYY<sep>MM<sep>DD" -> "YYYY-MM-DD"
std::optional<std::string> parse_date_part(std::string_view date, char sep) {
    std::array<int, 3> fields{};
    std::size_t start = 0;

    for (std::size_t i = 0; i < fields.size(); ++i) {
        const auto end = (i + 1 < fields.size()) ? date.find(sep, start) : date.size();
        if (end == std::string_view::npos) return std::nullopt;
        if (!parse_number(date.substr(start, end - start), fields[i])) return std::nullopt;
        start = end + 1;
    }

    const auto [year, month, day] = fields;
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }
    return fmt::format("{:04d}-{:02d}-{:02d}", year, month, day);
}

std::optional<std::string> read_tag(Exiv2::Image& image, const DateTagProbe& probe) {
    std::string value;

    if (probe.source == MetadataSource::Exif) {
        Exiv2::ExifData& exif = image.exifData();
        auto it = exif.findKey(Exiv2::ExifKey(probe.key));
        if (it != exif.end()) value = it->toString();
    } else {
        Exiv2::XmpData& xmp = image.xmpData();
        auto it = xmp.findKey(Exiv2::XmpKey(probe.key));
        if (it != xmp.end()) value = it->toString();
    }

    const auto trimmed = trim(value);
    if (trimmed.empty()) return std::nullopt;
    return std::string(trimmed);
}

void forward_exiv2_log(int level, const char* message) {
    std::string_view text = trim(message ? message : "");
    switch (level) {
        case Exiv2::LogMsg::debug:
        case Exiv2::LogMsg::info:
        case Exiv2::LogMsg::warn:
            spdlog::debug("exiv2: {}", text);
            break;
        case Exiv2::LogMsg::error:
            spdlog::warn("exiv2: {}", text);
            break;
        default:
            break;
    }
}

}  // anonymous namespace

const std::vector<DateTagProbe>& capture_date_probes() {
    static const std::vector<DateTagProbe> probes = {
        {MetadataSource::Exif, "Exif.Photo.DateTimeOriginal"},
        {MetadataSource::Exif, "Exif.Image.DateTime"},
        {MetadataSource::Xmp,  "Xmp.exif.DateTimeOriginal"},
        {MetadataSource::Xmp,  "Xmp.tiff.DateTime"},
    };
    return probes;
}

std::optional<std::string> normalize_capture_date(std::string_view raw) {
    raw = trim(raw);
    if (raw.empty()) return std::nullopt;

    // Date part ends at the first space (EXIF) or 'T' (XMP/ISO 8601)
    const std::string_view date = raw.substr(0, raw.find_first_of(" T"));

    if (auto colon = parse_date_part(date, ':')) {
        return colon;
    }
    return parse_date_part(date, '-');
}

std::optional<std::string> extract_capture_date(const std::vector<unsigned char>& encoded) {
    if (encoded.empty()) return std::nullopt;

    try {
        auto image = Exiv2::ImageFactory::open(encoded.data(), encoded.size());
        if (!image.get()) return std::nullopt;
        image->readMetadata();

        for (const auto& probe : capture_date_probes()) {
            auto value = read_tag(*image, probe);
            if (!value) continue;

            spdlog::debug("{} = \"{}\"", probe.key, *value);
            auto date = normalize_capture_date(*value);
            if (!date) {
                spdlog::debug("Unrecognized timestamp format: \"{}\"", *value);
            }
            return date;
        }
    } catch (const Exiv2::Error& e) {
        spdlog::debug("Metadata not readable: {}", e.what());
    } catch (const std::exception& e) {
        // Exiv2's bounds checks throw std::overflow_error / std::out_of_range on bad offsets
        spdlog::debug("Malformed metadata block: {}", e.what());
    }
    return std::nullopt;
}

std::optional<std::string> extract_capture_date(const SourceImage& image) {
    return extract_capture_date(image.bytes);
}

void install_exiv2_log_forwarding() {
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::debug);
    Exiv2::LogMsg::setHandler(forward_exiv2_log);
}

}  // namespace pdm
