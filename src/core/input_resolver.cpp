/**
 * @file    input_resolver.cpp
 * @brief   Input path validation and image enumeration
 * @license MIT
 */

#include "core/input_resolver.hpp"
#include "core/types.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace fs = std::filesystem;

namespace pdm {

namespace {

std::string lower_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// "/a/b/", "/a/b/." and "b" all name the directory "b"
fs::path normalize_dir(const fs::path& dir) {
    fs::path normal = fs::absolute(dir).lexically_normal();
    if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

}  // anonymous namespace

bool is_supported_image(const fs::path& path) {
    const std::string ext = lower_extension(path);
    return std::find(kSupportedExtensions.begin(), kSupportedExtensions.end(), ext)
           != kSupportedExtensions.end();
}

void validate_input_path(const fs::path& path) {
    if (path.empty()) {
        throw InvalidPathError("Path is empty");
    }

    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        throw InvalidPathError(fmt::format("Path does not exist: {}", path));
    }
    if (!fs::is_regular_file(status) && !fs::is_directory(status)) {
        throw InvalidPathError(fmt::format("Not a file or directory: {}", path));
    }
}

std::vector<fs::path> list_images(const fs::path& directory) {
    std::vector<fs::path> images;

    for (const auto& entry : fs::directory_iterator(directory)) {
        std::error_code ec;
        if (!entry.is_regular_file(ec)) continue;
        if (!is_supported_image(entry.path())) continue;
        images.push_back(entry.path());
    }

    std::sort(images.begin(), images.end(),
              [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); });
    return images;
}

ResolvedInput resolve_input(const fs::path& path) {
    validate_input_path(path);

    ResolvedInput resolved;

    if (fs::is_directory(path)) {
        resolved.source_dir = normalize_dir(path);
        resolved.targets = list_images(path);
        spdlog::debug("Found {} image(s) in {}", resolved.targets.size(), resolved.source_dir);
        return resolved;
    }

    resolved.single_file = true;
    resolved.source_dir = normalize_dir(fs::absolute(path).parent_path());

    if (is_supported_image(path)) {
        resolved.targets.push_back(path);
    } else {
        spdlog::warn("Unsupported extension '{}': {}", path.extension().string(), path.filename());
        resolved.unsupported.push_back(path);
    }
    return resolved;
}

fs::path output_dir_for(const fs::path& source_dir) {
    const fs::path dir = normalize_dir(source_dir);
    std::string name = to_utf8(dir.filename());
    if (name.empty()) {
        // Filesystem root has no name to derive from
        name = "root";
    }
    name += kOutputDirSuffix;

    const fs::path parent = dir.has_parent_path() ? dir.parent_path() : dir;
    return parent / path_from_utf8(name);
}

fs::path ensure_output_dir(const fs::path& source_dir) {
    const fs::path out = output_dir_for(source_dir);
    if (!fs::exists(out)) {
        fs::create_directories(out);
        spdlog::debug("Created output directory: {}", out);
    }
    return out;
}

}  // namespace pdm
