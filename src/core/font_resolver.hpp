/**
 * @file    font_resolver.hpp
 * @brief   Text font interface and font lookup chain
 * @license MIT
 *
 * @details
 * Two font backends sit behind the same interface:
 *   - FreeType (cv::freetype): scalable TrueType/OpenType/TTC fonts
 *   - Hershey  (cv::putText):  built-in vector font, always available,
 *                              fixed size chosen by the backend
 *
 * resolve_font() walks an ordered list of load attempts and returns the
 * first that succeeds; the Hershey font terminates the chain.
 */

#pragma once

#include <opencv2/core.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pdm {

// =============================================================================
// Font Interface
// =============================================================================

class TextFont {
public:
    virtual ~TextFont() = default;

    TextFont() = default;
    TextFont(const TextFont&) = delete;
    TextFont& operator=(const TextFont&) = delete;

    /**
     * Bounding box of the rendered string (ascent + descent), without stroke
     */
    [[nodiscard]] virtual cv::Size measure(const std::string& text) const = 0;

    /**
     * Distance from the top of the bounding box to the baseline
     */
    [[nodiscard]] virtual int ascent(const std::string& text) const = 0;

    /**
     * Draw the outline pass: glyph contours widened by `stroke_width` on each side
     *
     * @throws cv::Exception  if the backend cannot draw outlines
     */
    virtual void draw_outline(cv::Mat& canvas, const std::string& text, cv::Point top_left,
                              const cv::Scalar& color, int stroke_width) const = 0;

    /**
     * Draw the filled glyphs with the bounding box's top-left at `top_left`
     */
    virtual void draw_fill(cv::Mat& canvas, const std::string& text, cv::Point top_left,
                           const cv::Scalar& color) const = 0;

    /**
     * True for fonts that honor the requested size
     */
    [[nodiscard]] virtual bool scalable() const noexcept = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

// =============================================================================
// Backends
// =============================================================================

/**
 * Load a scalable font file at `pixel_size`.
 *
 * @return  nullptr if the file is missing, not a font, or cannot be measured
 */
[[nodiscard]] std::unique_ptr<TextFont> load_freetype_font(
    const std::filesystem::path& file,
    int pixel_size
);

/**
 * The built-in Hershey simplex font at its fixed default scale
 */
[[nodiscard]] std::unique_ptr<TextFont> make_builtin_font();

// =============================================================================
// Lookup chain
// =============================================================================

/**
 * Well-known font files in probe order: generic sans-serif and CJK-capable
 * fonts on Windows, Linux and macOS.
 */
[[nodiscard]] const std::vector<std::filesystem::path>& well_known_font_paths();

/**
 * Directories searched (recursively) when looking up a font by file name
 */
[[nodiscard]] std::vector<std::filesystem::path> font_search_dirs();

/**
 * Find a font by file name (case-insensitive) in the working directory,
 * then in `search_dirs`.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_font_by_name(
    std::string_view file_name,
    const std::vector<std::filesystem::path>& search_dirs
);

using FontAttempt = std::function<std::unique_ptr<TextFont>()>;

/**
 * Ordered load attempts for `pixel_size`, optionally led by an explicit file
 */
[[nodiscard]] std::vector<FontAttempt> font_attempts(
    int pixel_size,
    const std::optional<std::filesystem::path>& preferred = std::nullopt
);

/**
 * First successful attempt; never returns nullptr.
 */
[[nodiscard]] std::unique_ptr<TextFont> resolve_font(
    int pixel_size,
    const std::optional<std::filesystem::path>& preferred = std::nullopt
);

}  // namespace pdm
