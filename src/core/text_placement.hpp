/**
 * @file    text_placement.hpp
 * @brief   Named anchors and text box placement
 * @license MIT
 */

#pragma once

#include "core/types.hpp"

#include <opencv2/core.hpp>

#include <array>
#include <optional>
#include <string_view>

namespace pdm {

/**
 * Where the text bounding box is placed on the canvas
 */
enum class Anchor {
    LeftTop,
    LeftBottom,
    RightTop,
    RightBottom,
    Center,
    TopCenter,
    BottomCenter
};

inline constexpr std::array<Anchor, 7> kAllAnchors = {
    Anchor::LeftTop, Anchor::LeftBottom, Anchor::RightTop, Anchor::RightBottom,
    Anchor::Center, Anchor::TopCenter, Anchor::BottomCenter
};

[[nodiscard]] constexpr std::string_view to_string(Anchor anchor) noexcept {
    switch (anchor) {
        case Anchor::LeftTop:      return "left_top";
        case Anchor::LeftBottom:   return "left_bottom";
        case Anchor::RightTop:     return "right_top";
        case Anchor::RightBottom:  return "right_bottom";
        case Anchor::Center:       return "center";
        case Anchor::TopCenter:    return "top_center";
        case Anchor::BottomCenter: return "bottom_center";
        default:                   return "left_top";
    }
}

/**
 * Exact canonical key ("right_bottom") to anchor
 */
[[nodiscard]] std::optional<Anchor> anchor_from_key(std::string_view key) noexcept;

/**
 * Lenient lookup: unknown keys fall back to Anchor::LeftTop
 */
[[nodiscard]] Anchor anchor_or_default(std::string_view key) noexcept;

/**
 * Top-left corner of a text box of size `text` placed on `canvas`.
 *
 * Edge-aligned anchors keep `margin` pixels from the edge and clamp at 0
 * when the text does not fit; centered axes use floor((W - w) / 2), which
 * goes negative when the text is larger than the canvas.
 */
[[nodiscard]] cv::Point compute_position(
    cv::Size canvas,
    cv::Size text,
    Anchor anchor,
    int margin = kDefaultMargin
) noexcept;

}  // namespace pdm
