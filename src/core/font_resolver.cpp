/**
 * @file    font_resolver.cpp
 * @brief   FreeType / Hershey font backends and the font lookup chain
 * @license MIT
 */

#include "core/font_resolver.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/freetype.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace fs = std::filesystem;

namespace pdm {

namespace {

// Probe string used to verify a font can actually render at a size
constexpr const char* kProbeText = "2000-01-01";

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// =============================================================================
// FreeType backend
// =============================================================================

class FreeTypeFont final : public TextFont {
public:
    FreeTypeFont(cv::Ptr<cv::freetype::FreeType2> face, fs::path file, int pixel_size)
        : face_(std::move(face)), file_(std::move(file)), pixel_size_(pixel_size) {}

    cv::Size measure(const std::string& text) const override {
        int baseline = 0;
        cv::Size size = face_->getTextSize(text, pixel_size_, -1, &baseline);
        return {size.width, size.height + baseline};
    }

    int ascent(const std::string& text) const override {
        int baseline = 0;
        return face_->getTextSize(text, pixel_size_, -1, &baseline).height;
    }

    void draw_outline(cv::Mat& canvas, const std::string& text, cv::Point top_left,
                      const cv::Scalar& color, int stroke_width) const override {
        // Positive thickness strokes the glyph contours, centered on the contour
        face_->putText(canvas, text, baseline_origin(text, top_left), pixel_size_,
                       color, stroke_width * 2, cv::LINE_AA, true);
    }

    void draw_fill(cv::Mat& canvas, const std::string& text, cv::Point top_left,
                   const cv::Scalar& color) const override {
        face_->putText(canvas, text, baseline_origin(text, top_left), pixel_size_,
                       color, -1, cv::LINE_AA, true);
    }

    bool scalable() const noexcept override { return true; }

    std::string describe() const override {
        return fmt::format("{} @ {}px", file_.filename(), pixel_size_);
    }

private:
    cv::Point baseline_origin(const std::string& text, cv::Point top_left) const {
        return {top_left.x, top_left.y + ascent(text)};
    }

    cv::Ptr<cv::freetype::FreeType2> face_;
    fs::path file_;
    int pixel_size_;
};

// =============================================================================
// Hershey backend (built into OpenCV, no files needed)
// =============================================================================

class HersheyFont final : public TextFont {
public:
    cv::Size measure(const std::string& text) const override {
        int baseline = 0;
        cv::Size size = cv::getTextSize(text, kFace, kScale, kThickness, &baseline);
        return {size.width, size.height + baseline};
    }

    int ascent(const std::string& text) const override {
        int baseline = 0;
        return cv::getTextSize(text, kFace, kScale, kThickness, &baseline).height;
    }

    void draw_outline(cv::Mat& canvas, const std::string& text, cv::Point top_left,
                      const cv::Scalar& color, int stroke_width) const override {
        cv::putText(canvas, text, {top_left.x, top_left.y + ascent(text)}, kFace, kScale,
                    color, kThickness + stroke_width * 2, cv::LINE_AA);
    }

    void draw_fill(cv::Mat& canvas, const std::string& text, cv::Point top_left,
                   const cv::Scalar& color) const override {
        cv::putText(canvas, text, {top_left.x, top_left.y + ascent(text)}, kFace, kScale,
                    color, kThickness, cv::LINE_AA);
    }

    bool scalable() const noexcept override { return false; }

    std::string describe() const override {
        return "built-in Hershey simplex (fixed size)";
    }

private:
    static constexpr int kFace = cv::FONT_HERSHEY_SIMPLEX;
    static constexpr double kScale = 1.0;
    static constexpr int kThickness = 2;
};

}  // anonymous namespace

// =============================================================================
// Backends
// =============================================================================

std::unique_ptr<TextFont> load_freetype_font(const fs::path& file, int pixel_size) {
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        spdlog::debug("Font not found: {}", file);
        return nullptr;
    }

    try {
        auto face = cv::freetype::createFreeType2();
        face->loadFontData(to_utf8(file), 0);

        auto font = std::make_unique<FreeTypeFont>(face, file, pixel_size);
        const cv::Size probe = font->measure(kProbeText);
        if (probe.width <= 0 || probe.height <= 0) {
            spdlog::debug("Font {} produced an empty text box at {}px", file, pixel_size);
            return nullptr;
        }
        return font;
    } catch (const cv::Exception& e) {
        spdlog::debug("Failed to load font {}: {}", file, e.what());
        return nullptr;
    }
}

std::unique_ptr<TextFont> make_builtin_font() {
    return std::make_unique<HersheyFont>();
}

// =============================================================================
// Lookup chain
// =============================================================================

const std::vector<fs::path>& well_known_font_paths() {
    static const std::vector<fs::path> paths = {
        "C:/Windows/Fonts/arial.ttf",
        "C:/Windows/Fonts/msyh.ttc",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/opentype/noto/NotoSansCJK-Regular.ttc",
        "/Library/Fonts/Arial.ttf",
        "/System/Library/Fonts/PingFang.ttc",
    };
    return paths;
}

std::vector<fs::path> font_search_dirs() {
    std::vector<fs::path> dirs;

#ifdef _WIN32
    if (const char* windir = std::getenv("WINDIR")) {
        dirs.emplace_back(fs::path(windir) / "Fonts");
    }
    if (const char* local = std::getenv("LOCALAPPDATA")) {
        dirs.emplace_back(fs::path(local) / "Microsoft" / "Windows" / "Fonts");
    }
#else
    if (const char* home = std::getenv("HOME")) {
        dirs.emplace_back(fs::path(home) / ".local" / "share" / "fonts");
        dirs.emplace_back(fs::path(home) / ".fonts");
        dirs.emplace_back(fs::path(home) / "Library" / "Fonts");
    }
    dirs.emplace_back("/usr/local/share/fonts");
    dirs.emplace_back("/usr/share/fonts");
    dirs.emplace_back("/Library/Fonts");
    dirs.emplace_back("/System/Library/Fonts");
#endif

    std::error_code ec;
    dirs.erase(std::remove_if(dirs.begin(), dirs.end(),
                              [&ec](const fs::path& d) { return !fs::is_directory(d, ec); }),
               dirs.end());
    return dirs;
}

std::optional<fs::path> find_font_by_name(std::string_view file_name,
                                          const std::vector<fs::path>& search_dirs) {
    const std::string wanted = lower(std::string(file_name));
    std::error_code ec;

    const fs::path local = fs::current_path(ec) / fs::path(std::string(file_name));
    if (!ec && fs::is_regular_file(local, ec)) {
        return local;
    }

    for (const auto& dir : search_dirs) {
        fs::recursive_directory_iterator it(
            dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            spdlog::debug("Cannot scan font directory {}: {}", dir, ec.message());
            continue;
        }

        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) break;
            if (!it->is_regular_file(ec)) continue;
            if (lower(it->path().filename().string()) == wanted) {
                return it->path();
            }
        }
    }
    return std::nullopt;
}

std::vector<FontAttempt> font_attempts(int pixel_size, const std::optional<fs::path>& preferred) {
    std::vector<FontAttempt> attempts;

    if (preferred) {
        attempts.emplace_back([pixel_size, file = *preferred]() {
            auto font = load_freetype_font(file, pixel_size);
            if (!font) spdlog::warn("Requested font unusable, falling back: {}", file);
            return font;
        });
    }

    for (const auto& file : well_known_font_paths()) {
        attempts.emplace_back([pixel_size, file]() {
            return load_freetype_font(file, pixel_size);
        });
    }

    for (const char* name : {"arial.ttf", "DejaVuSans.ttf"}) {
        attempts.emplace_back([pixel_size, name]() -> std::unique_ptr<TextFont> {
            auto found = find_font_by_name(name, font_search_dirs());
            if (!found) return nullptr;
            return load_freetype_font(*found, pixel_size);
        });
    }

    attempts.emplace_back([]() { return make_builtin_font(); });
    return attempts;
}

std::unique_ptr<TextFont> resolve_font(int pixel_size, const std::optional<fs::path>& preferred) {
    for (const auto& attempt : font_attempts(pixel_size, preferred)) {
        if (auto font = attempt()) {
            if (font->scalable()) {
                spdlog::info("Using font: {}", font->describe());
            } else {
                spdlog::warn("No scalable font found, using {}; requested size {} is ignored",
                             font->describe(), pixel_size);
            }
            return font;
        }
    }

    // The last attempt cannot fail
    return make_builtin_font();
}

}  // namespace pdm
