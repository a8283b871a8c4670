/**
 * @file    test_utils.hpp
 * @brief   Fixtures shared by the unit tests
 * @license MIT
 */

#pragma once

#include <exiv2/exiv2.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace pdm::test {

// Scratch directory removed at scope exit
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "pdm_";
        name += info ? info->name() : "test";
        name += "_" + std::to_string(rd());
        path_ = std::filesystem::temp_directory_path() / name;
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path make_dir(const std::string& name) const {
        auto dir = path_ / name;
        std::filesystem::create_directories(dir);
        return dir;
    }

private:
    std::filesystem::path path_;
};

// Smooth gradient so JPEG encoding stays well-behaved
inline cv::Mat make_image(int width, int height, int channels = 3) {
    cv::Mat img(height, width, CV_8UC(channels));
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            uchar* px = img.ptr<uchar>(y) + x * channels;
            for (int c = 0; c < channels; ++c) {
                px[c] = static_cast<uchar>(c == 3 ? 255 : 64 + (x + y + 40 * c) % 128);
            }
        }
    }
    return img;
}

inline cv::Mat make_flat_image(int width, int height, int value = 128) {
    return cv::Mat(height, width, CV_8UC3, cv::Scalar::all(value));
}

inline void write_image(const std::filesystem::path& path, const cv::Mat& img) {
    ASSERT_TRUE(cv::imwrite(path.string(), img)) << path;
}

inline void write_garbage(const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::binary);
    file << "this is not an image at all";
}

inline void tag_exif(const std::filesystem::path& path, const std::string& key, const std::string& value) {
    auto image = Exiv2::ImageFactory::open(path.string());
    image->readMetadata();
    Exiv2::ExifData exif = image->exifData();
    exif[key] = value;
    image->setExifData(exif);
    image->writeMetadata();
}

inline void tag_xmp(const std::filesystem::path& path, const std::string& key, const std::string& value) {
    auto image = Exiv2::ImageFactory::open(path.string());
    image->readMetadata();
    Exiv2::XmpData xmp = image->xmpData();
    xmp[key] = value;
    image->setXmpData(xmp);
    image->writeMetadata();
}

// JPEG carrying Exif.Photo.DateTimeOriginal
// Valid JPEG pixels with an APP1 Exif block whose first IFD offset points far past the end
inline void write_jpeg_with_corrupt_exif(const std::filesystem::path& path) {
    std::vector<uchar> jpeg;
    ASSERT_TRUE(cv::imencode(".jpg", make_image(64, 48), jpeg));

    const std::vector<uchar> app1 = {
        0xFF, 0xE1, 0x00, 0x10,                 // APP1, length 16
        'E', 'x', 'i', 'f', 0x00, 0x00,
        'I', 'I', 0x2A, 0x00,                   // little-endian TIFF header
        0xF0, 0xFF, 0xFF, 0xFF,                 // IFD0 offset
    };
    jpeg.insert(jpeg.begin() + 2, app1.begin(), app1.end());

    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(jpeg.data()), static_cast<std::streamsize>(jpeg.size()));
}

inline void write_dated_jpeg(const std::filesystem::path& path, const std::string& timestamp,
                             int width = 320, int height = 240) {
    write_image(path, make_image(width, height));
    tag_exif(path, "Exif.Photo.DateTimeOriginal", timestamp);
}

}  // namespace pdm::test
