/**
 * @file    source_image.cpp
 * @brief   Image file loading
 * @license MIT
 */

#include "core/source_image.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace pdm {

SourceImage load_source_image(const std::filesystem::path& path) {
    SourceImage image;
    image.path = path;

    {
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (!file) {
            throw std::runtime_error(fmt::format("Failed to open image: {}", path));
        }
        image.bytes.assign(std::istreambuf_iterator<char>(file),
                           std::istreambuf_iterator<char>());
        if (file.bad()) {
            throw std::runtime_error(fmt::format("Failed to read image: {}", path));
        }
    }

    if (image.bytes.empty()) {
        throw std::runtime_error(fmt::format("Image file is empty: {}", path));
    }

    image.pixels = cv::imdecode(image.bytes, cv::IMREAD_UNCHANGED);
    if (image.pixels.empty()) {
        throw std::runtime_error(fmt::format("Failed to decode image: {}", path));
    }

    spdlog::debug("Loaded {} ({}x{}, {} channel(s), {} bytes)",
                  path.filename(), image.pixels.cols, image.pixels.rows,
                  image.pixels.channels(), image.bytes.size());
    return image;
}

}  // namespace pdm
