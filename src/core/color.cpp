/**
 * @file    color.cpp
 * @brief   Named / hex / functional color parsing
 * @license MIT
 */

#include "core/color.hpp"
#include "core/vocabulary.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <vector>

namespace pdm {

namespace {

struct NamedColor {
    std::string_view name;
    std::uint32_t rgb;      // 0xRRGGBB
};

// CSS Color Module Level 4 named colors
constexpr NamedColor kNamedColors[] = {
    {"aliceblue", 0xf0f8ff},        {"antiquewhite", 0xfaebd7},     {"aqua", 0x00ffff},
    {"aquamarine", 0x7fffd4},       {"azure", 0xf0ffff},            {"beige", 0xf5f5dc},
    {"bisque", 0xffe4c4},           {"black", 0x000000},            {"blanchedalmond", 0xffebcd},
    {"blue", 0x0000ff},             {"blueviolet", 0x8a2be2},       {"brown", 0xa52a2a},
    {"burlywood", 0xdeb887},        {"cadetblue", 0x5f9ea0},        {"chartreuse", 0x7fff00},
    {"chocolate", 0xd2691e},        {"coral", 0xff7f50},            {"cornflowerblue", 0x6495ed},
    {"cornsilk", 0xfff8dc},         {"crimson", 0xdc143c},          {"cyan", 0x00ffff},
    {"darkblue", 0x00008b},         {"darkcyan", 0x008b8b},         {"darkgoldenrod", 0xb8860b},
    {"darkgray", 0xa9a9a9},         {"darkgrey", 0xa9a9a9},         {"darkgreen", 0x006400},
    {"darkkhaki", 0xbdb76b},        {"darkmagenta", 0x8b008b},      {"darkolivegreen", 0x556b2f},
    {"darkorange", 0xff8c00},       {"darkorchid", 0x9932cc},       {"darkred", 0x8b0000},
    {"darksalmon", 0xe9967a},       {"darkseagreen", 0x8fbc8f},     {"darkslateblue", 0x483d8b},
    {"darkslategray", 0x2f4f4f},    {"darkslategrey", 0x2f4f4f},    {"darkturquoise", 0x00ced1},
    {"darkviolet", 0x9400d3},       {"deeppink", 0xff1493},         {"deepskyblue", 0x00bfff},
    {"dimgray", 0x696969},          {"dimgrey", 0x696969},          {"dodgerblue", 0x1e90ff},
    {"firebrick", 0xb22222},        {"floralwhite", 0xfffaf0},      {"forestgreen", 0x228b22},
    {"fuchsia", 0xff00ff},          {"gainsboro", 0xdcdcdc},        {"ghostwhite", 0xf8f8ff},
    {"gold", 0xffd700},             {"goldenrod", 0xdaa520},        {"gray", 0x808080},
    {"grey", 0x808080},             {"green", 0x008000},            {"greenyellow", 0xadff2f},
    {"honeydew", 0xf0fff0},         {"hotpink", 0xff69b4},          {"indianred", 0xcd5c5c},
    {"indigo", 0x4b0082},           {"ivory", 0xfffff0},            {"khaki", 0xf0e68c},
    {"lavender", 0xe6e6fa},         {"lavenderblush", 0xfff0f5},    {"lawngreen", 0x7cfc00},
    {"lemonchiffon", 0xfffacd},     {"lightblue", 0xadd8e6},        {"lightcoral", 0xf08080},
    {"lightcyan", 0xe0ffff},        {"lightgoldenrodyellow", 0xfafad2},
    {"lightgray", 0xd3d3d3},        {"lightgrey", 0xd3d3d3},        {"lightgreen", 0x90ee90},
    {"lightpink", 0xffb6c1},        {"lightsalmon", 0xffa07a},      {"lightseagreen", 0x20b2aa},
    {"lightskyblue", 0x87cefa},     {"lightslategray", 0x778899},   {"lightslategrey", 0x778899},
    {"lightsteelblue", 0xb0c4de},   {"lightyellow", 0xffffe0},      {"lime", 0x00ff00},
    {"limegreen", 0x32cd32},        {"linen", 0xfaf0e6},            {"magenta", 0xff00ff},
    {"maroon", 0x800000},           {"mediumaquamarine", 0x66cdaa}, {"mediumblue", 0x0000cd},
    {"mediumorchid", 0xba55d3},     {"mediumpurple", 0x9370db},     {"mediumseagreen", 0x3cb371},
    {"mediumslateblue", 0x7b68ee},  {"mediumspringgreen", 0x00fa9a},
    {"mediumturquoise", 0x48d1cc},  {"mediumvioletred", 0xc71585},  {"midnightblue", 0x191970},
    {"mintcream", 0xf5fffa},        {"mistyrose", 0xffe4e1},        {"moccasin", 0xffe4b5},
    {"navajowhite", 0xffdead},      {"navy", 0x000080},             {"oldlace", 0xfdf5e6},
    {"olive", 0x808000},            {"olivedrab", 0x6b8e23},        {"orange", 0xffa500},
    {"orangered", 0xff4500},        {"orchid", 0xda70d6},           {"palegoldenrod", 0xeee8aa},
    {"palegreen", 0x98fb98},        {"paleturquoise", 0xafeeee},    {"palevioletred", 0xdb7093},
    {"papayawhip", 0xffefd5},       {"peachpuff", 0xffdab9},        {"peru", 0xcd853f},
    {"pink", 0xffc0cb},             {"plum", 0xdda0dd},             {"powderblue", 0xb0e0e6},
    {"purple", 0x800080},           {"rebeccapurple", 0x663399},    {"red", 0xff0000},
    {"rosybrown", 0xbc8f8f},        {"royalblue", 0x4169e1},        {"saddlebrown", 0x8b4513},
    {"salmon", 0xfa8072},           {"sandybrown", 0xf4a460},       {"seagreen", 0x2e8b57},
    {"seashell", 0xfff5ee},         {"sienna", 0xa0522d},           {"silver", 0xc0c0c0},
    {"skyblue", 0x87ceeb},          {"slateblue", 0x6a5acd},        {"slategray", 0x708090},
    {"slategrey", 0x708090},        {"snow", 0xfffafa},             {"springgreen", 0x00ff7f},
    {"steelblue", 0x4682b4},        {"tan", 0xd2b48c},              {"teal", 0x008080},
    {"thistle", 0xd8bfd8},          {"tomato", 0xff6347},           {"turquoise", 0x40e0d0},
    {"violet", 0xee82ee},           {"wheat", 0xf5deb3},            {"white", 0xffffff},
    {"whitesmoke", 0xf5f5f5},       {"yellow", 0xffff00},           {"yellowgreen", 0x9acd32},
};

constexpr Rgb from_packed(std::uint32_t rgb) {
    return Rgb{
        static_cast<std::uint8_t>((rgb >> 16) & 0xff),
        static_cast<std::uint8_t>((rgb >> 8) & 0xff),
        static_cast<std::uint8_t>(rgb & 0xff)
    };
}

// [0, 1] -> [0, 255], rounded half up
std::uint8_t unit_to_byte(double v) {
    return static_cast<std::uint8_t>(std::clamp(static_cast<int>(v * 255.0 + 0.5), 0, 255));
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

// "rgb", "rgba", "rrggbb" or "rrggbbaa"; alpha is ignored
std::optional<Rgb> parse_hex(std::string_view hex) {
    if (hex.size() != 3 && hex.size() != 4 && hex.size() != 6 && hex.size() != 8) {
        return std::nullopt;
    }

    std::array<int, 8> digits{};
    for (std::size_t i = 0; i < hex.size(); ++i) {
        digits[i] = hex_digit(hex[i]);
        if (digits[i] < 0) return std::nullopt;
    }

    if (hex.size() <= 4) {
        // #abc == #aabbcc
        return Rgb{
            static_cast<std::uint8_t>(digits[0] * 17),
            static_cast<std::uint8_t>(digits[1] * 17),
            static_cast<std::uint8_t>(digits[2] * 17)
        };
    }
    return Rgb{
        static_cast<std::uint8_t>(digits[0] * 16 + digits[1]),
        static_cast<std::uint8_t>(digits[2] * 16 + digits[3]),
        static_cast<std::uint8_t>(digits[4] * 16 + digits[5])
    };
}

struct Component {
    double value{0.0};
    bool percent{false};
};

std::string_view trim_spaces(std::string_view s) {
    while (!s.empty() && s.front() == ' ') s.remove_prefix(1);
    while (!s.empty() && s.back() == ' ') s.remove_suffix(1);
    return s;
}

// "a, b%, c" -> components; empty on any malformed entry
std::vector<Component> parse_components(std::string_view body) {
    std::vector<Component> out;

    while (true) {
        const auto comma = body.find(',');
        std::string_view item = trim_spaces(body.substr(0, comma));

        Component c;
        if (!item.empty() && item.back() == '%') {
            c.percent = true;
            item.remove_suffix(1);
        }
        if (item.empty() || item.front() == '-' || item.front() == '+') return {};

        const auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), c.value);
        if (ec != std::errc{} || ptr != item.data() + item.size() || !std::isfinite(c.value)) {
            return {};
        }
        out.push_back(c);

        if (comma == std::string_view::npos) break;
        body.remove_prefix(comma + 1);
    }
    return out;
}

// Body of "name(...)", if `token` has that form
std::optional<std::string_view> function_body(std::string_view token, std::string_view name) {
    if (token.size() < name.size() + 2) return std::nullopt;
    if (token.substr(0, name.size()) != name) return std::nullopt;
    if (token[name.size()] != '(' || token.back() != ')') return std::nullopt;
    return token.substr(name.size() + 1, token.size() - name.size() - 2);
}

bool is_integral(double v) {
    return std::floor(v) == v;
}

// rgb(255, 0, 0), rgb(100%, 0%, 0%), rgba(255, 0, 0, 128)
std::optional<Rgb> parse_rgb_function(const std::vector<Component>& parts, bool with_alpha) {
    if (parts.size() != (with_alpha ? 4u : 3u)) return std::nullopt;

    const bool percent = parts[0].percent;
    std::array<std::uint8_t, 3> channels{};

    for (std::size_t i = 0; i < 3; ++i) {
        if (parts[i].percent != percent) return std::nullopt;
        if (percent) {
            if (parts[i].value > 100.0) return std::nullopt;
            channels[i] = unit_to_byte(parts[i].value / 100.0);
        } else {
            if (!is_integral(parts[i].value) || parts[i].value > 255.0) return std::nullopt;
            channels[i] = static_cast<std::uint8_t>(parts[i].value);
        }
    }
    if (with_alpha && (parts[3].percent || parts[3].value > 255.0)) return std::nullopt;

    return Rgb{channels[0], channels[1], channels[2]};
}

double hls_channel(double m1, double m2, double hue) {
    hue = hue - std::floor(hue);
    if (hue < 1.0 / 6.0) return m1 + (m2 - m1) * hue * 6.0;
    if (hue < 0.5) return m2;
    if (hue < 2.0 / 3.0) return m1 + (m2 - m1) * (2.0 / 3.0 - hue) * 6.0;
    return m1;
}

// Expects "h, s%, x%": degrees then two percentages
bool hue_triple(const std::vector<Component>& parts, double& h, double& s, double& x) {
    if (parts.size() != 3 || parts[0].percent || !parts[1].percent || !parts[2].percent) {
        return false;
    }
    if (parts[1].value > 100.0 || parts[2].value > 100.0) return false;
    h = parts[0].value / 360.0;
    s = parts[1].value / 100.0;
    x = parts[2].value / 100.0;
    return true;
}

// hsl(0, 100%, 50%)
std::optional<Rgb> parse_hsl_function(const std::vector<Component>& parts) {
    double h = 0, s = 0, l = 0;
    if (!hue_triple(parts, h, s, l)) return std::nullopt;

    if (s == 0.0) {
        const auto v = unit_to_byte(l);
        return Rgb{v, v, v};
    }
    const double m2 = (l <= 0.5) ? l * (1.0 + s) : l + s - l * s;
    const double m1 = 2.0 * l - m2;
    return Rgb{
        unit_to_byte(hls_channel(m1, m2, h + 1.0 / 3.0)),
        unit_to_byte(hls_channel(m1, m2, h)),
        unit_to_byte(hls_channel(m1, m2, h - 1.0 / 3.0))
    };
}

// hsv(0, 100%, 100%) / hsb(...)
std::optional<Rgb> parse_hsv_function(const std::vector<Component>& parts) {
    double h = 0, s = 0, v = 0;
    if (!hue_triple(parts, h, s, v)) return std::nullopt;

    h = h - std::floor(h);
    const int sector = static_cast<int>(h * 6.0) % 6;
    const double f = h * 6.0 - std::floor(h * 6.0);
    const double p = v * (1.0 - s);
    const double q = v * (1.0 - s * f);
    const double t = v * (1.0 - s * (1.0 - f));

    double r = v, g = t, b = p;
    switch (sector) {
        case 0: r = v; g = t; b = p; break;
        case 1: r = q; g = v; b = p; break;
        case 2: r = p; g = v; b = t; break;
        case 3: r = p; g = q; b = v; break;
        case 4: r = t; g = p; b = v; break;
        default: r = v; g = p; b = q; break;
    }
    return Rgb{unit_to_byte(r), unit_to_byte(g), unit_to_byte(b)};
}

}  // anonymous namespace

std::optional<Rgb> parse_color(std::string_view text) {
    const std::string canonical = canonical_color_name(text);
    const std::string_view token = canonical;
    if (token.empty()) return std::nullopt;

    if (token.front() == '#') {
        return parse_hex(token.substr(1));
    }

    if (auto body = function_body(token, "rgb")) {
        return parse_rgb_function(parse_components(*body), false);
    }
    if (auto body = function_body(token, "rgba")) {
        return parse_rgb_function(parse_components(*body), true);
    }
    if (auto body = function_body(token, "hsl")) {
        return parse_hsl_function(parse_components(*body));
    }
    if (auto body = function_body(token, "hsv")) {
        return parse_hsv_function(parse_components(*body));
    }
    if (auto body = function_body(token, "hsb")) {
        return parse_hsv_function(parse_components(*body));
    }

    for (const auto& named : kNamedColors) {
        if (named.name == token) return from_packed(named.rgb);
    }
    return std::nullopt;
}

std::string to_hex(const Rgb& color) {
    return fmt::format("#{:02x}{:02x}{:02x}", color.r, color.g, color.b);
}

}  // namespace pdm
