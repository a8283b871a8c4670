/**
 * @file    path_formatter.hpp
 * @brief   UTF-8 helpers and fmt formatter for std::filesystem::path
 * @license MIT
 *
 * @details
 * Photo folders frequently carry non-ASCII names (CJK album names, accents).
 * path.string() is ANSI on Windows, while spdlog/fmt and the terminal expect
 * UTF-8, so every path that reaches a log line or prompt goes through here.
 *
 * Usage:
 *   #include "utils/path_formatter.hpp"
 *   spdlog::info("Saved: {}", out_path);            // formatter below
 *   auto p = pdm::path_from_user_input(line);       // typed or dropped path
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace pdm {

/**
 * Convert filesystem path to UTF-8 encoded std::string
 *
 * C++20 u8string() returns std::u8string (char8_t), hence the cast.
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

/**
 * Convert UTF-8 string to filesystem path
 *
 * Console input is switched to UTF-8 at startup, so on Windows the bytes
 * must go through a wide string instead of the ANSI code page.
 */
inline std::filesystem::path path_from_utf8(std::string_view utf8_str) {
#ifdef _WIN32
    if (utf8_str.empty()) return {};

    int len = MultiByteToWideChar(CP_UTF8, 0, utf8_str.data(),
                                  static_cast<int>(utf8_str.size()), nullptr, 0);
    if (len <= 0) return std::filesystem::path(std::string(utf8_str));

    std::wstring wstr(len, L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8_str.data(),
                        static_cast<int>(utf8_str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    return std::filesystem::path(std::string(utf8_str));
#endif
}

/**
 * Build a path from a line the user typed or dragged into the terminal
 *
 * Strips surrounding whitespace and one pair of matching quotes,
 * e.g. "C:\My Photos\a.jpg" or '/home/me/My Photos'.
 */
inline std::filesystem::path path_from_user_input(std::string_view text) {
    constexpr std::string_view kSpace = " \t\r\n";

    const auto first = text.find_first_not_of(kSpace);
    if (first == std::string_view::npos) return {};
    text = text.substr(first, text.find_last_not_of(kSpace) - first + 1);

    if (text.size() >= 2 &&
        (text.front() == '"' || text.front() == '\'') &&
        text.back() == text.front()) {
        text = text.substr(1, text.size() - 2);
    }
    return path_from_utf8(text);
}

}  // namespace pdm

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        auto u8 = p.u8string();
        std::string_view sv{
            reinterpret_cast<const char*>(u8.data()),
            u8.size()
        };
        return fmt::formatter<std::string_view>::format(sv, ctx);
    }
};
