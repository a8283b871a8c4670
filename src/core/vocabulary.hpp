/**
 * @file    vocabulary.hpp
 * @brief   Localized (Chinese) names for colors and positions
 * @license MIT
 *
 * @details
 * Closed alias tables checked before validation. An alias maps to the
 * canonical English identifier; anything else passes through unchanged
 * (trimmed, ASCII lower-cased) to the color / anchor parsers.
 *
 *   "白色"  -> "white"        "右下"  -> "right_bottom"
 *   "White" -> "white"        "#FFF"  -> "#fff"
 */

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pdm {

using AliasTable = std::vector<std::pair<std::string_view, std::string_view>>;

[[nodiscard]] const AliasTable& color_aliases();
[[nodiscard]] const AliasTable& position_aliases();

/**
 * Trim surrounding whitespace and lower-case ASCII letters
 */
[[nodiscard]] std::string normalize_token(std::string_view text);

[[nodiscard]] std::string canonical_color_name(std::string_view text);
[[nodiscard]] std::string canonical_position_name(std::string_view text);

}  // namespace pdm
