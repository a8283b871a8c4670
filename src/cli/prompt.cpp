/**
 * @file    prompt.cpp
 * @brief   Interactive console prompts
 * @license MIT
 */

#include "cli/prompt.hpp"
#include "core/vocabulary.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>

namespace pdm::cli {

std::string Prompter::read_line(std::string_view question) {
    fmt::print(out_, fmt::fg(fmt::color::cyan), "{}", question);
    std::fflush(out_);

    std::string line;
    if (!std::getline(in_, line)) {
        // EOF, or the read was interrupted by SIGINT
        throw UserCancelled();
    }
    throw_if_cancelled();
    return line;
}

void Prompter::report(std::string_view message) {
    fmt::print(out_, fmt::fg(fmt::color::red), "{}\n", message);
}

WatermarkRequest collect_request(Prompter& prompter, const PresetAnswers& presets) {
    WatermarkRequest request;

    request.input = prompter.ask_until_valid(
        "Image file or folder path: ", presets.input,
        [](const std::string& text) { return parse_input_path(text); });

    request.font_size = prompter.ask_until_valid(
        "Font size (e.g. 36): ", presets.font_size,
        [](const std::string& text) { return parse_font_size(text); });

    request.color = prompter.ask_until_valid(
        "Text color (e.g. white, black, #FFFFFF, 白色): ", presets.color,
        [&request](const std::string& text) {
            Rgb color = parse_fill_color(text);
            request.color_text = normalize_token(text);
            return color;
        });

    const std::string position_question = fmt::format(
        "Position ({}, or 左上 / 左下 / 右上 / 右下 / 居中 / 顶部居中 / 底部居中): ",
        anchor_choices());
    request.anchor = prompter.ask_until_valid(
        position_question, presets.position,
        [](const std::string& text) { return parse_position(text); });

    spdlog::debug("Request: input={}, size={}, color={} ({}), position={}",
                  request.input, request.font_size, request.color_text,
                  to_hex(request.color), to_string(request.anchor));
    return request;
}

}  // namespace pdm::cli
