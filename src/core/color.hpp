/**
 * @file    color.hpp
 * @brief   Text fill color parsing
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pdm {

struct Rgb {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};

    constexpr bool operator==(const Rgb&) const noexcept = default;

    /**
     * OpenCV channel order with an opaque alpha, usable on BGR and BGRA canvases
     */
    [[nodiscard]] cv::Scalar to_bgra() const {
        return cv::Scalar(b, g, r, 255);
    }
};

/**
 * Parse a color the way an image library's color table does:
 *   - the CSS named colors ("white", "crimson", "darkgray", ...)
 *   - "#rgb", "#rgba", "#rrggbb" and "#rrggbbaa" (alpha ignored)
 *   - "rgb(r, g, b)" with 0-255 or percentage components, "rgba(r, g, b, a)"
 *   - "hsl(h, s%, l%)" and "hsv(h, s%, v%)" / "hsb(...)"
 * Case-insensitive. Localized aliases are resolved first (see vocabulary.hpp).
 *
 * @return  std::nullopt if the text is not a recognized color
 */
[[nodiscard]] std::optional<Rgb> parse_color(std::string_view text);

/**
 * "#rrggbb"
 */
[[nodiscard]] std::string to_hex(const Rgb& color);

}  // namespace pdm
