/**
 * @file    types.hpp
 * @brief   Shared type definitions for PhotoDateMark
 * @license MIT
 */

#pragma once

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pdm {

// Version info
inline constexpr const char* kVersion = "1.0.0";

// Rendering defaults
inline constexpr int kDefaultMargin = 12;       // Distance from canvas edges (px)
inline constexpr int kDefaultStrokeWidth = 2;   // Dark outline around glyphs (px)
inline constexpr int kDefaultJpegQuality = 95;
inline constexpr int kDefaultPngCompression = 6;

// Lower-case, with leading dot
inline constexpr std::array<std::string_view, 3> kSupportedExtensions = {
    ".jpg", ".jpeg", ".png"
};

// Suffix appended to the source directory name for the output directory
inline constexpr std::string_view kOutputDirSuffix = "_watermark";

// =============================================================================
// Per-item outcome
// =============================================================================

enum class ItemStatus {
    Processed,
    Skipped,
    Failed
};

enum class SkipReason {
    NoCaptureDate,
    UnsupportedExtension
};

[[nodiscard]] constexpr std::string_view to_string(ItemStatus status) noexcept {
    switch (status) {
        case ItemStatus::Processed: return "Processed";
        case ItemStatus::Skipped:   return "Skipped";
        case ItemStatus::Failed:    return "Failed";
        default:                    return "Unknown";
    }
}

[[nodiscard]] constexpr std::string_view to_string(SkipReason reason) noexcept {
    switch (reason) {
        case SkipReason::NoCaptureDate:        return "no capture date";
        case SkipReason::UnsupportedExtension: return "unsupported extension";
        default:                               return "unknown";
    }
}

// =============================================================================
// Errors
// =============================================================================

/**
 * Path does not exist, or is neither a regular file nor a directory.
 * Raised while validating user input; callers re-prompt.
 */
class InvalidPathError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Font size, color or position could not be parsed.
 * Raised while validating user input; callers re-prompt.
 */
class InvalidParameterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Interrupt signal or end of input. Aborts the whole run.
 */
class UserCancelled : public std::runtime_error {
public:
    UserCancelled() : std::runtime_error("Cancelled by user") {}
};

}  // namespace pdm
