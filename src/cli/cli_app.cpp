/**
 * @file    cli_app.cpp
 * @brief   CLI Application Implementation
 * @license MIT
 *
 * @details
 * Command-line interface for PhotoDateMark.
 * Every prompt can be pre-answered with a flag or a config file entry;
 * the rest is asked interactively.
 */

#include "cli/cli_app.hpp"
#include "cli/prompt.hpp"
#include "core/batch_processor.hpp"
#include "core/cancellation.hpp"
#include "core/date_extractor.hpp"
#include "core/font_resolver.hpp"
#include "core/input_resolver.hpp"
#include "core/watermark_engine.hpp"
#include "utils/exception_name.hpp"
#include "utils/path_formatter.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#ifdef _WIN32
    #include <windows.h>
#endif

namespace fs = std::filesystem;

namespace pdm::cli {

namespace {

// =============================================================================
// Platform-specific console setup
// =============================================================================

void setup_console() {
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut != INVALID_HANDLE_VALUE) {
        DWORD dwMode = 0;
        if (GetConsoleMode(hOut, &dwMode)) {
            dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hOut, dwMode);
        }
    }
#endif
}

// =============================================================================
// Banner printing
// =============================================================================

void print_banner() {
    fmt::print(fmt::fg(fmt::color::medium_purple), "\n  PhotoDateMark");
    fmt::print(fmt::fg(fmt::color::gray), "  v{}\n", kVersion);
    fmt::print(fmt::fg(fmt::color::gray), "  Stamps photos with the date they were taken\n\n");
}

void setup_logging(bool verbose, bool quiet) {
    auto logger = spdlog::stdout_color_mt("pdm");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%^%l%$] %v");

    if (quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

void print_request(const WatermarkRequest& request, const TextFont& font) {
    fmt::print(fmt::fg(fmt::color::gray),
               "\n  Input:    {}\n  Font:     {}\n  Color:    {} ({})\n  Position: {}\n\n",
               request.input, font.describe(), request.color_text,
               to_hex(request.color), to_string(request.anchor));
}

std::optional<std::string> as_preset(const std::string& value) {
    if (value.empty()) return std::nullopt;
    return value;
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

int run(int argc, char** argv) {
    setup_console();

    CLI::App app{"PhotoDateMark - stamp photos with their capture date"};
    app.footer("\nValues not given as options are asked interactively.");
    app.set_version_flag("-V,--version", kVersion);
    app.set_config("--config", "", "Read options from an INI/TOML file");

    // Prompt answers
    std::string input_path;
    std::string font_size;
    std::string color;
    std::string position;

    app.add_option("-i,--input", input_path, "Image file or directory");
    app.add_option("-s,--size", font_size, "Font size in pixels (positive integer)");
    app.add_option("-c,--color", color, "Text color: name, #RRGGBB, rgb(r,g,b) or localized name");
    app.add_option("-p,--position", position,
                   "Text position: left_top, left_bottom, right_top, right_bottom, "
                   "center, top_center, bottom_center (or localized name)");

    // Rendering
    std::string font_file;
    int jpeg_quality = kDefaultJpegQuality;

    app.add_option("--font", font_file, "TrueType/OpenType font file to try first");
    app.add_option("--quality", jpeg_quality, "JPEG output quality")
        ->check(CLI::Range(1, 100));

    // Behaviour
    bool no_prompt = false;
    bool verbose = false;
    bool quiet = false;

    app.add_flag("--no-prompt", no_prompt, "Fail instead of asking for missing values");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Suppress all output except errors");

    CLI11_PARSE(app, argc, argv);

    setup_logging(verbose, quiet);
    install_exiv2_log_forwarding();
    install_interrupt_handler();

    if (!quiet) {
        print_banner();
    }

    try {
        Prompter prompter(std::cin, stdout, !no_prompt);
        const PresetAnswers presets{
            as_preset(input_path), as_preset(font_size), as_preset(color), as_preset(position)
        };

        WatermarkRequest request = collect_request(prompter, presets);
        request.jpeg_quality = jpeg_quality;
        if (!font_file.empty()) {
            request.font_file = path_from_user_input(font_file);
        }

        auto font = resolve_font(request.font_size, request.font_file);
        if (!quiet) {
            print_request(request, *font);
        }

        TextStyle style;
        style.fill = request.color;
        style.anchor = request.anchor;

        WatermarkEngine engine(std::move(font), style);

        const ResolvedInput resolved = resolve_input(request.input);
        const RunSummary summary = run_batch(resolved, engine, request.jpeg_quality);

        if (summary.total() == 0) {
            fmt::print(fmt::fg(fmt::color::yellow),
                       "\nNo processable images (jpg/jpeg/png) found in {}\n", resolved.source_dir);
        } else {
            summary.print();
        }
        return 0;

    } catch (const UserCancelled&) {
        fmt::print(fmt::fg(fmt::color::yellow), "\nCancelled.\n");
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {} ({})", e.what(), exception_name(e));
        return 1;
    }
}

}  // namespace pdm::cli
