#include "cli/prompt.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <memory>
#include <sstream>

using namespace pdm;
using namespace pdm::cli;
using namespace pdm::test;

namespace {

struct FileCloser {
    void operator()(std::FILE* f) const { std::fclose(f); }
};
using TempFile = std::unique_ptr<std::FILE, FileCloser>;

std::string contents(std::FILE* f) {
    std::fflush(f);
    std::rewind(f);
    std::string text;
    char buf[256];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        text.append(buf, n);
    }
    return text;
}

size_t occurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

}  // namespace

TEST(Prompter, asks_again_until_value_is_valid) {
    // GIVEN: two bad answers followed by a good one
    std::istringstream in("abc\n0\n42\n");
    TempFile out(std::tmpfile());
    ASSERT_TRUE(out);
    Prompter prompter(in, out.get());

    // WHEN: asking for a font size
    const int size = prompter.ask_until_valid(
        "Font size: ", std::nullopt, [](const std::string& text) { return parse_font_size(text); });

    // THEN: the third answer is taken and the question was shown three times
    EXPECT_EQ(size, 42);
    EXPECT_EQ(occurrences(contents(out.get()), "Font size: "), 3u);
}

TEST(Prompter, preset_answers_without_reading) {
    std::istringstream in("");
    TempFile out(std::tmpfile());
    Prompter prompter(in, out.get());

    const Anchor anchor = prompter.ask_until_valid(
        "Position: ", std::string("右下"), [](const std::string& text) { return parse_position(text); });

    EXPECT_EQ(anchor, Anchor::RightBottom);
    EXPECT_EQ(occurrences(contents(out.get()), "Position: "), 0u);
}

TEST(Prompter, invalid_preset_falls_back_to_prompt) {
    std::istringstream in("24\n");
    TempFile out(std::tmpfile());
    Prompter prompter(in, out.get());

    const int size = prompter.ask_until_valid(
        "Font size: ", std::string("huge"), [](const std::string& text) { return parse_font_size(text); });

    EXPECT_EQ(size, 24);
}

TEST(Prompter, end_of_input_cancels) {
    std::istringstream in("abc\n");
    TempFile out(std::tmpfile());
    Prompter prompter(in, out.get());

    EXPECT_THROW((void)prompter.ask_until_valid(
                     "Font size: ", std::nullopt,
                     [](const std::string& text) { return parse_font_size(text); }),
                 UserCancelled);
}

TEST(Prompter, non_interactive_mode_never_reads) {
    std::istringstream in("36\n");
    TempFile out(std::tmpfile());
    Prompter prompter(in, out.get(), false);

    EXPECT_THROW((void)prompter.ask_until_valid(
                     "Font size: ", std::nullopt,
                     [](const std::string& text) { return parse_font_size(text); }),
                 InvalidParameterError);
    EXPECT_THROW((void)prompter.ask_until_valid(
                     "Font size: ", std::string("-1"),
                     [](const std::string& text) { return parse_font_size(text); }),
                 InvalidParameterError);
}

TEST(CollectRequest, gathers_all_four_answers) {
    // GIVEN: a folder and typed answers, with one retry on the position
    TempDir tmp;
    const auto dir = tmp.make_dir("photos");
    std::istringstream in(dir.string() + "\n48\n白色\nsomewhere\n右下\n");
    TempFile out(std::tmpfile());
    Prompter prompter(in, out.get());

    // WHEN: collecting the request
    const WatermarkRequest request = collect_request(prompter, PresetAnswers{});

    // THEN: every answer is parsed into the request
    EXPECT_EQ(request.input, dir);
    EXPECT_EQ(request.font_size, 48);
    EXPECT_EQ(request.color, (Rgb{255, 255, 255}));
    EXPECT_EQ(request.color_text, "白色");
    EXPECT_EQ(request.anchor, Anchor::RightBottom);
}

TEST(CollectRequest, presets_skip_their_questions) {
    TempDir tmp;
    const auto dir = tmp.make_dir("photos");
    std::istringstream in("#ff0000\n");
    TempFile out(std::tmpfile());
    Prompter prompter(in, out.get());

    PresetAnswers presets;
    presets.input = dir.string();
    presets.font_size = "20";
    presets.position = "center";

    const WatermarkRequest request = collect_request(prompter, presets);

    EXPECT_EQ(request.font_size, 20);
    EXPECT_EQ(request.color, (Rgb{255, 0, 0}));
    EXPECT_EQ(request.anchor, Anchor::Center);
    EXPECT_EQ(occurrences(contents(out.get()), "Font size"), 0u);
}
