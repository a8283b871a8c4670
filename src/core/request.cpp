/**
 * @file    request.cpp
 * @brief   Validation of user-entered batch parameters
 * @license MIT
 */

#include "core/request.hpp"
#include "core/input_resolver.hpp"
#include "core/vocabulary.hpp"
#include "utils/path_formatter.hpp"

#include <fmt/format.h>

#include <charconv>

namespace pdm {

namespace {

// Full-width forms typed by CJK input methods: U+FF10..U+FF19 digits, U+FF0B plus
std::string fold_full_width_digits(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto b0 = static_cast<unsigned char>(text[i]);
        if (b0 == 0xEF && i + 2 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0xBC) {
            const auto b2 = static_cast<unsigned char>(text[i + 2]);
            if (b2 >= 0x90 && b2 <= 0x99) {
                out.push_back(static_cast<char>('0' + (b2 - 0x90)));
                i += 2;
                continue;
            }
            if (b2 == 0x8B) {
                out.push_back('+');
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

}  // anonymous namespace

int parse_font_size(std::string_view text) {
    std::string token = fold_full_width_digits(normalize_token(text));
    if (token.size() > 1 && token.front() == '+') {
        token.erase(0, 1);
    }

    int value = 0;
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (token.empty() || ec != std::errc{} || ptr != token.data() + token.size()) {
        throw InvalidParameterError(fmt::format("Not a whole number: \"{}\"", text));
    }
    if (value <= 0) {
        throw InvalidParameterError(fmt::format("Font size must be positive, got {}", value));
    }
    return value;
}

Rgb parse_fill_color(std::string_view text) {
    auto color = parse_color(text);
    if (!color) {
        throw InvalidParameterError(fmt::format("Unrecognized color: \"{}\"", text));
    }
    return *color;
}

Anchor parse_position(std::string_view text) {
    auto anchor = anchor_from_key(canonical_position_name(text));
    if (!anchor) {
        throw InvalidParameterError(fmt::format("Unrecognized position: \"{}\"", text));
    }
    return *anchor;
}

std::filesystem::path parse_input_path(std::string_view text) {
    auto path = path_from_user_input(text);
    validate_input_path(path);
    return path;
}

std::string anchor_choices() {
    std::string choices;
    for (Anchor anchor : kAllAnchors) {
        if (!choices.empty()) choices += " / ";
        choices += to_string(anchor);
    }
    return choices;
}

}  // namespace pdm
