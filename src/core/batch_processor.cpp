/**
 * @file    batch_processor.cpp
 * @brief   Batch driver implementation
 * @license MIT
 */

#include "core/batch_processor.hpp"
#include "core/cancellation.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>

namespace pdm {

int RunSummary::total_skipped() const noexcept {
    int total = 0;
    for (const auto& [reason, count] : skipped) {
        total += count;
    }
    return total;
}

void RunSummary::record(const ProcessResult& result) {
    switch (result.status) {
        case ItemStatus::Processed:
            processed++;
            break;
        case ItemStatus::Skipped:
            skipped[result.skip_reason.value_or(SkipReason::NoCaptureDate)]++;
            break;
        case ItemStatus::Failed:
            failed++;
            break;
    }
}

void RunSummary::print() const {
    fmt::print(fmt::fg(fmt::color::green), "\n[OK] Completed: {} processed", processed);

    const int skip_count = total_skipped();
    fmt::print(fmt::fg(fmt::color::yellow), ", {} skipped", skip_count);
    if (skip_count > 0) {
        fmt::print(fmt::fg(fmt::color::gray), " (");
        bool first = true;
        for (const auto& [reason, count] : skipped) {
            fmt::print(fmt::fg(fmt::color::gray), "{}{}: {}", first ? "" : ", ", to_string(reason), count);
            first = false;
        }
        fmt::print(fmt::fg(fmt::color::gray), ")");
    }

    if (failed > 0) {
        fmt::print(fmt::fg(fmt::color::red), ", {} failed", failed);
    }
    fmt::print("\n");

    if (output_dir) {
        fmt::print("Output directory: {}\n", *output_dir);
    }
}

RunSummary run_batch(const ResolvedInput& input, WatermarkEngine& engine, int jpeg_quality) {
    RunSummary summary;

    for (const auto& path : input.unsupported) {
        spdlog::warn("Skipped (unsupported extension): {}", path.filename());
        summary.skipped[SkipReason::UnsupportedExtension]++;
    }

    if (input.targets.empty()) {
        if (input.unsupported.empty()) {
            spdlog::debug("No processable images in {}", input.source_dir);
        }
        return summary;
    }

    const auto output_dir = ensure_output_dir(input.source_dir);
    summary.output_dir = output_dir;

    spdlog::info("Processing {} image(s) from {}", input.targets.size(), input.source_dir);

    for (const auto& target : input.targets) {
        throw_if_cancelled();
        summary.record(process_image(target, output_dir, engine, jpeg_quality));
    }

    return summary;
}

}  // namespace pdm
