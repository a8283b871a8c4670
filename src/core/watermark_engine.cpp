/**
 * @file    watermark_engine.cpp
 * @brief   PhotoDateMark - Watermark Engine
 * @license MIT
 *
 * @details
 * Text rendering on an 8-bit BGRA working copy, and the per-image
 * load → date → render → save step used by the batch driver.
 */

#include "core/watermark_engine.hpp"
#include "core/date_extractor.hpp"
#include "core/source_image.hpp"
#include "utils/exception_name.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace pdm {

namespace {

// Any depth/layout -> 8-bit BGRA copy
cv::Mat to_working_canvas(const cv::Mat& image) {
    cv::Mat src = image;
    if (image.depth() != CV_8U) {
        double scale = 1.0;
        if (image.depth() == CV_16U) {
            scale = 1.0 / 257.0;
        } else if (image.depth() == CV_32F || image.depth() == CV_64F) {
            scale = 255.0;
        }
        image.convertTo(src, CV_8U, scale);
        spdlog::debug("Converted {}-bit input to 8-bit", image.elemSize1() * 8);
    }

    cv::Mat canvas;
    switch (src.channels()) {
        case 1: cv::cvtColor(src, canvas, cv::COLOR_GRAY2BGRA); break;
        case 3: cv::cvtColor(src, canvas, cv::COLOR_BGR2BGRA); break;
        case 4: canvas = src.clone(); break;
        default:
            throw std::runtime_error(fmt::format("Unsupported channel count: {}", src.channels()));
    }
    return canvas;
}

// BGRA canvas -> original channel layout
cv::Mat restore_layout(const cv::Mat& canvas, int channels) {
    cv::Mat out;
    switch (channels) {
        case 1: cv::cvtColor(canvas, out, cv::COLOR_BGRA2GRAY); break;
        case 3: cv::cvtColor(canvas, out, cv::COLOR_BGRA2BGR); break;
        default: out = canvas; break;
    }
    return out;
}

std::string lower_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

}  // anonymous namespace

WatermarkEngine::WatermarkEngine(std::unique_ptr<TextFont> font, TextStyle style)
    : font_(std::move(font)), style_(style), outline_enabled_(style.stroke_width > 0) {
    if (!font_) {
        throw std::invalid_argument("WatermarkEngine requires a font");
    }
    spdlog::debug("Engine: font={}, fill={}, anchor={}, stroke={}px, margin={}px",
                  font_->describe(), to_hex(style_.fill), to_string(style_.anchor),
                  style_.stroke_width, style_.margin);
}

cv::Rect WatermarkEngine::text_region(cv::Size canvas, const std::string& text) const {
    const cv::Size box = font_->measure(text);
    const cv::Point pos = compute_position(canvas, box, style_.anchor, style_.margin);
    return {pos, box};
}

cv::Mat WatermarkEngine::add_watermark(const cv::Mat& image, const std::string& text) {
    if (image.empty()) {
        throw std::runtime_error("Empty image provided");
    }

    cv::Mat canvas = to_working_canvas(image);
    const cv::Rect region = text_region(canvas.size(), text);

    spdlog::debug("Drawing \"{}\" at ({}, {}) size {}x{} on {}x{}",
                  text, region.x, region.y, region.width, region.height,
                  canvas.cols, canvas.rows);

    if (outline_enabled_) {
        try {
            font_->draw_outline(canvas, text, region.tl(), style_.stroke.to_bgra(),
                                style_.stroke_width);
        } catch (const cv::Exception& e) {
            // Canvas may hold a partial outline; start over on a fresh copy
            outline_enabled_ = false;
            canvas = to_working_canvas(image);
            spdlog::warn("Outline rendering unsupported by {}, drawing plain text: {}",
                         font_->describe(), e.what());
        }
    }
    font_->draw_fill(canvas, text, region.tl(), style_.fill.to_bgra());

    return restore_layout(canvas, image.channels());
}

void save_image(const cv::Mat& image, const std::filesystem::path& output_path, int jpeg_quality) {
    std::vector<int> params;
    const std::string ext = lower_extension(output_path);

    if (ext == ".jpg" || ext == ".jpeg") {
        params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality};
    } else if (ext == ".png") {
        params = {cv::IMWRITE_PNG_COMPRESSION, kDefaultPngCompression};
    }

    // Encode in memory so non-ASCII paths work on every platform
    std::vector<unsigned char> encoded;
    if (!cv::imencode(ext, image, encoded, params)) {
        throw std::runtime_error(fmt::format("Failed to encode image as {}", ext));
    }

    std::ofstream file(output_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error(fmt::format("Failed to open for writing: {}", output_path));
    }
    file.write(reinterpret_cast<const char*>(encoded.data()),
               static_cast<std::streamsize>(encoded.size()));
    if (!file) {
        throw std::runtime_error(fmt::format("Failed to write image: {}", output_path));
    }
}

ProcessResult process_image(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_dir,
    WatermarkEngine& engine,
    int jpeg_quality) {

    ProcessResult result{};

    try {
        std::optional<std::string> date;
        cv::Mat stamped;
        {
            // Buffer released before the next item is opened
            SourceImage source = load_source_image(input_path);

            spdlog::debug("Processing: {} ({}x{})",
                          input_path.filename(), source.pixels.cols, source.pixels.rows);

            date = extract_capture_date(source);
            if (!date) {
                result.status = ItemStatus::Skipped;
                result.skip_reason = SkipReason::NoCaptureDate;
                result.message = "No capture date in metadata";
                spdlog::warn("Skipped (no capture date): {}", input_path.filename());
                return result;
            }

            stamped = engine.add_watermark(source.pixels, *date);
        }

        const auto output_path = output_dir / input_path.filename();
        save_image(stamped, output_path, jpeg_quality);

        result.status = ItemStatus::Processed;
        result.date = *date;
        result.output_path = output_path;
        result.message = fmt::format("Stamped {}", *date);
        spdlog::info("Saved: {} [{}]", output_path, *date);
        return result;

    } catch (const std::exception& e) {
        result.status = ItemStatus::Failed;
        result.message = fmt::format("{}: {}", exception_name(e), e.what());
        spdlog::error("Failed to process {}: {}", input_path.filename(), result.message);
        return result;
    }
}

} // namespace pdm
