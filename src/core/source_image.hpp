/**
 * @file    source_image.hpp
 * @brief   One input photo held in memory: raw bytes plus decoded pixels
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>

#include <filesystem>
#include <vector>

namespace pdm {

/**
 * The file is read once; pixels are decoded from the buffer with OpenCV
 * and metadata is parsed from the same buffer with Exiv2.
 */
struct SourceImage {
    std::filesystem::path path;
    std::vector<unsigned char> bytes;   // Encoded file contents
    cv::Mat pixels;                     // Decoded, unchanged channel layout and depth
};

/**
 * Read and decode an image file.
 *
 * Pixels are decoded with cv::IMREAD_UNCHANGED, so gray, BGR and BGRA
 * inputs keep their layout and no EXIF orientation is applied.
 *
 * @throws std::runtime_error  if the file cannot be read or decoded
 */
[[nodiscard]] SourceImage load_source_image(const std::filesystem::path& path);

}  // namespace pdm
