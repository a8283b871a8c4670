/**
 * @file    vocabulary.cpp
 * @brief   Alias tables for localized color and position names
 * @license MIT
 */

#include "core/vocabulary.hpp"

#include <algorithm>
#include <cctype>

namespace pdm {

namespace {

std::string lookup(const AliasTable& table, std::string_view text) {
    std::string token = normalize_token(text);
    for (const auto& [alias, canonical] : table) {
        if (token == alias) return std::string(canonical);
    }
    return token;
}

}  // anonymous namespace

const AliasTable& color_aliases() {
    static const AliasTable table = {
        {"白色", "white"},   {"白", "white"},
        {"黑色", "black"},   {"黑", "black"},
        {"红色", "red"},     {"红", "red"},
        {"绿色", "green"},   {"绿", "green"},
        {"蓝色", "blue"},    {"蓝", "blue"},
        {"黄色", "yellow"},  {"黄", "yellow"},
        {"橙色", "orange"},  {"橘色", "orange"},
        {"紫色", "purple"},  {"粉色", "pink"},
        {"灰色", "gray"},    {"灰", "gray"},
        {"青色", "cyan"},    {"金色", "gold"},
        {"银色", "silver"},  {"棕色", "brown"},
    };
    return table;
}

const AliasTable& position_aliases() {
    static const AliasTable table = {
        {"左上", "left_top"},       {"左上角", "left_top"},
        {"左下", "left_bottom"},    {"左下角", "left_bottom"},
        {"右上", "right_top"},      {"右上角", "right_top"},
        {"右下", "right_bottom"},   {"右下角", "right_bottom"},
        {"居中", "center"},         {"中间", "center"},       {"中心", "center"},
        {"顶部居中", "top_center"}, {"上中", "top_center"},
        {"底部居中", "bottom_center"}, {"下中", "bottom_center"},
    };
    return table;
}

std::string normalize_token(std::string_view text) {
    constexpr std::string_view kSpace = " \t\r\n";
    const auto first = text.find_first_not_of(kSpace);
    if (first == std::string_view::npos) return {};
    text = text.substr(first, text.find_last_not_of(kSpace) - first + 1);

    // Bytes >= 0x80 (UTF-8 continuation/lead bytes) are left untouched
    std::string token(text);
    std::transform(token.begin(), token.end(), token.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return token;
}

std::string canonical_color_name(std::string_view text) {
    return lookup(color_aliases(), text);
}

std::string canonical_position_name(std::string_view text) {
    return lookup(position_aliases(), text);
}

}  // namespace pdm
