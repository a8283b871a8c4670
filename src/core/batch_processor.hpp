/**
 * @file    batch_processor.hpp
 * @brief   Batch driver: stamp every resolved target, tally outcomes
 * @license MIT
 */

#pragma once

#include "core/input_resolver.hpp"
#include "core/types.hpp"
#include "core/watermark_engine.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <vector>

namespace pdm {

/**
 * Counts for one run, printed at the end
 */
struct RunSummary {
    int processed{0};
    int failed{0};
    std::map<SkipReason, int> skipped;      // Breakdown by reason
    std::optional<std::filesystem::path> output_dir;   // Unset when nothing was attempted

    [[nodiscard]] int total_skipped() const noexcept;
    [[nodiscard]] int total() const noexcept { return processed + failed + total_skipped(); }

    void record(const ProcessResult& result);
    void print() const;
};

/**
 * Run the batch sequentially.
 *
 * Unsupported single-file inputs are tallied as skips. The output
 * directory is created only when there is at least one target.
 * Per-item failures never abort the loop; an interrupt does.
 *
 * @throws UserCancelled  if an interrupt is received between items
 */
RunSummary run_batch(
    const ResolvedInput& input,
    WatermarkEngine& engine,
    int jpeg_quality = kDefaultJpegQuality
);

}  // namespace pdm
