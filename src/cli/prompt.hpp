/**
 * @file    prompt.hpp
 * @brief   Interactive console prompts with validation and re-prompting
 * @license MIT
 */

#pragma once

#include "core/cancellation.hpp"
#include "core/request.hpp"
#include "core/types.hpp"

#include <fmt/core.h>
#include <fmt/color.h>

#include <cstdio>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace pdm::cli {

/**
 * Values supplied on the command line or in a config file.
 * Each one answers its prompt; an invalid one is reported and re-asked.
 */
struct PresetAnswers {
    std::optional<std::string> input;
    std::optional<std::string> font_size;
    std::optional<std::string> color;
    std::optional<std::string> position;
};

class Prompter {
public:
    /**
     * @param in           Console input (std::cin in the application)
     * @param out          Where questions and validation errors are printed
     * @param interactive  When false, a missing or invalid preset is fatal
     */
    Prompter(std::istream& in, std::FILE* out, bool interactive = true)
        : in_(in), out_(out), interactive_(interactive) {}

    /**
     * Ask until `parse` accepts the answer.
     *
     * `parse` throws InvalidParameterError / InvalidPathError to reject.
     *
     * @throws UserCancelled          on interrupt or end of input
     * @throws InvalidParameterError  in non-interactive mode
     */
    template <typename Parse>
    auto ask_until_valid(std::string_view question,
                         std::optional<std::string> preset,
                         Parse&& parse) -> decltype(parse(std::string{})) {
        std::optional<std::string> answer = std::move(preset);

        while (true) {
            throw_if_cancelled();

            if (!answer) {
                if (!interactive_) {
                    throw InvalidParameterError(
                        fmt::format("Missing value for \"{}\" (prompting disabled)", question));
                }
                answer = read_line(question);
            }

            try {
                return parse(*answer);
            } catch (const InvalidParameterError& e) {
                report(e.what());
                if (!interactive_) throw;
            } catch (const InvalidPathError& e) {
                report(e.what());
                if (!interactive_) throw;
            }
            answer.reset();
        }
    }

    /**
     * @throws UserCancelled  on interrupt or end of input
     */
    std::string read_line(std::string_view question);

private:
    void report(std::string_view message);

    std::istream& in_;
    std::FILE* out_;
    bool interactive_;
};

/**
 * Ask for path, font size, color and position, in that order
 */
[[nodiscard]] WatermarkRequest collect_request(Prompter& prompter, const PresetAnswers& presets);

}  // namespace pdm::cli
