/**
 * @file    watermark_engine.hpp
 * @brief   Date-stamp watermark rendering and single-image processing
 * @license MIT
 */

#pragma once

#include "core/color.hpp"
#include "core/font_resolver.hpp"
#include "core/text_placement.hpp"
#include "core/types.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace pdm {

/**
 * How the stamp text is drawn
 */
struct TextStyle {
    Rgb fill{255, 255, 255};
    Rgb stroke{0, 0, 0};                    // Outline color (dark for contrast)
    int stroke_width{kDefaultStrokeWidth};  // 0 disables the outline pass
    Anchor anchor{Anchor::LeftTop};
    int margin{kDefaultMargin};
};

/**
 * Main watermark engine class
 *
 * Owns the resolved font and the text style for a batch run.
 *
 * Rendering pipeline (per image):
 *   1. copy to an 8-bit BGRA canvas
 *   2. measure text, place its box at the anchor
 *   3. outline pass (stroke color, widened glyphs), then fill pass
 *   4. convert back to the input channel layout
 */
class WatermarkEngine {
public:
    WatermarkEngine(std::unique_ptr<TextFont> font, TextStyle style);

    /**
     * Render `text` onto a copy of `image`.
     *
     * @param image  Gray, BGR or BGRA image; never modified
     * @param text   Stamp text (e.g. "2023-07-04")
     * @return       New image with the same size and channel count (8-bit)
     * @throws std::runtime_error  on empty images or unsupported channel counts
     */
    [[nodiscard]] cv::Mat add_watermark(const cv::Mat& image, const std::string& text);

    /**
     * Where `text` would be placed on a canvas of `canvas` size
     */
    [[nodiscard]] cv::Rect text_region(cv::Size canvas, const std::string& text) const;

    [[nodiscard]] const TextFont& font() const noexcept { return *font_; }
    [[nodiscard]] const TextStyle& style() const noexcept { return style_; }

    /**
     * False once the backend failed to draw an outline; later images are fill-only
     */
    [[nodiscard]] bool outline_enabled() const noexcept { return outline_enabled_; }

private:
    std::unique_ptr<TextFont> font_;
    TextStyle style_;
    bool outline_enabled_;
};

/**
 * Result of processing an image
 */
struct ProcessResult {
    ItemStatus status{ItemStatus::Failed};
    std::optional<SkipReason> skip_reason;    // Set when status == Skipped
    std::string date;                         // Stamp text, when found
    std::filesystem::path output_path;        // Set when status == Processed
    std::string message;                      // Status or error message
};

/**
 * Encode and write an image; format follows the file extension.
 * JPEG uses `jpeg_quality`, PNG uses compression level 6.
 *
 * @throws std::runtime_error  if encoding or writing fails
 */
void save_image(const cv::Mat& image,
                const std::filesystem::path& output_path,
                int jpeg_quality = kDefaultJpegQuality);

/**
 * Process a single image file: load, read capture date, stamp, save.
 *
 * Never throws: a missing date yields Skipped/NoCaptureDate, any
 * exception yields Failed with "<exception class>: <message>".
 *
 * @param input_path   Input image path
 * @param output_dir   Existing directory; output keeps the input filename
 * @param engine       The watermark engine to use
 * @param jpeg_quality JPEG encoder quality (1-100)
 * @return             Processing result
 */
ProcessResult process_image(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_dir,
    WatermarkEngine& engine,
    int jpeg_quality = kDefaultJpegQuality
);

} // namespace pdm
