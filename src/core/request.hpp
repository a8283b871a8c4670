/**
 * @file    request.hpp
 * @brief   Batch parameters and validation of user-entered values
 * @license MIT
 */

#pragma once

#include "core/color.hpp"
#include "core/text_placement.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace pdm {

/**
 * Immutable parameters of one batch run
 */
struct WatermarkRequest {
    std::filesystem::path input;
    int font_size{36};
    Rgb color{255, 255, 255};
    std::string color_text{"white"};         // As entered, for logs
    Anchor anchor{Anchor::LeftTop};
    std::optional<std::filesystem::path> font_file;
    int jpeg_quality{kDefaultJpegQuality};
};

/**
 * Positive decimal integer, surrounding whitespace allowed.
 * A leading "+" and full-width digits (３６) are accepted.
 *
 * @throws InvalidParameterError
 */
[[nodiscard]] int parse_font_size(std::string_view text);

/**
 * Localized name, English name, "#rgb", "#rrggbb" or "rgb(r, g, b)"
 *
 * @throws InvalidParameterError
 */
[[nodiscard]] Rgb parse_fill_color(std::string_view text);

/**
 * Localized name or one of the 7 canonical anchor keys
 *
 * @throws InvalidParameterError
 */
[[nodiscard]] Anchor parse_position(std::string_view text);

/**
 * Typed/dropped path that exists and is a file or directory
 *
 * @throws InvalidPathError
 */
[[nodiscard]] std::filesystem::path parse_input_path(std::string_view text);

/**
 * "left_top / left_bottom / ... / bottom_center"
 */
[[nodiscard]] std::string anchor_choices();

}  // namespace pdm
