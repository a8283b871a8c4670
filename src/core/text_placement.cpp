/**
 * @file    text_placement.cpp
 * @brief   Anchor lookup and position arithmetic
 * @license MIT
 */

#include "core/text_placement.hpp"

#include <algorithm>

namespace pdm {

namespace {

// Rounds toward negative infinity, so oversized text still centers symmetrically
constexpr int floor_half(int v) noexcept {
    return (v >= 0) ? v / 2 : -((-v + 1) / 2);
}

}  // anonymous namespace

std::optional<Anchor> anchor_from_key(std::string_view key) noexcept {
    for (Anchor anchor : kAllAnchors) {
        if (to_string(anchor) == key) return anchor;
    }
    return std::nullopt;
}

Anchor anchor_or_default(std::string_view key) noexcept {
    return anchor_from_key(key).value_or(Anchor::LeftTop);
}

cv::Point compute_position(cv::Size canvas, cv::Size text, Anchor anchor, int margin) noexcept {
    const int near_x = margin;
    const int near_y = margin;
    const int far_x = std::max(canvas.width - text.width - margin, 0);
    const int far_y = std::max(canvas.height - text.height - margin, 0);
    const int mid_x = floor_half(canvas.width - text.width);
    const int mid_y = floor_half(canvas.height - text.height);

    switch (anchor) {
        case Anchor::LeftTop:      return {near_x, near_y};
        case Anchor::LeftBottom:   return {near_x, far_y};
        case Anchor::RightTop:     return {far_x, near_y};
        case Anchor::RightBottom:  return {far_x, far_y};
        case Anchor::Center:       return {mid_x, mid_y};
        case Anchor::TopCenter:    return {mid_x, near_y};
        case Anchor::BottomCenter: return {mid_x, far_y};
    }
    return {near_x, near_y};
}

}  // namespace pdm
