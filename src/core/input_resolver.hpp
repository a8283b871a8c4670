/**
 * @file    input_resolver.hpp
 * @brief   Resolve a user-supplied path into the set of images to stamp
 * @license MIT
 */

#pragma once

#include <filesystem>
#include <vector>

namespace pdm {

/**
 * Result of resolving an input path
 */
struct ResolvedInput {
    std::filesystem::path source_dir;                  // Directory the images live in
    std::vector<std::filesystem::path> targets;        // Supported images, sorted by name
    std::vector<std::filesystem::path> unsupported;    // Single-file input with a foreign extension
    bool single_file{false};
};

/**
 * Case-insensitive membership of the extension in {.jpg, .jpeg, .png}
 */
[[nodiscard]] bool is_supported_image(const std::filesystem::path& path);

/**
 * Check that the path exists and is a regular file or a directory.
 *
 * @throws InvalidPathError  otherwise
 */
void validate_input_path(const std::filesystem::path& path);

/**
 * Direct (non-recursive) children of a directory with a supported extension,
 * sorted by filename.
 */
[[nodiscard]] std::vector<std::filesystem::path> list_images(const std::filesystem::path& directory);

/**
 * Resolve a file or directory into targets.
 *
 * Directory: every supported direct child.
 * File:      the file itself if supported, otherwise an empty target set
 *            with the file recorded in `unsupported`.
 *
 * @throws InvalidPathError  if the path does not exist or is neither file nor directory
 */
[[nodiscard]] ResolvedInput resolve_input(const std::filesystem::path& path);

/**
 * Sibling output directory for a source directory:
 *   /photos/trip  ->  /photos/trip_watermark
 */
[[nodiscard]] std::filesystem::path output_dir_for(const std::filesystem::path& source_dir);

/**
 * Create the output directory if missing (an existing one is reused).
 *
 * @return  the output directory path
 */
std::filesystem::path ensure_output_dir(const std::filesystem::path& source_dir);

}  // namespace pdm
