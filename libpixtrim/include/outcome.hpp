//
// Created by Giuseppe Francione on 02/12/25.
//

/**
 * @file outcome.hpp
 * @brief Per-file work items and results, and the aggregate run summary.
 */

#ifndef PIXTRIM_OUTCOME_HPP
#define PIXTRIM_OUTCOME_HPP

#include "errors.hpp"
#include "image_format.hpp"
#include "run_config.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pixtrim {

/**
 * @brief One discovered file, scheduled exactly once.
 */
struct ImageTask {
    std::filesystem::path source_path;
    ImageFormat detected_format;             ///< From the extension at scan time
    std::shared_ptr<const RunConfig> config;
};

enum class OutcomeStatus {
    Optimized, ///< A smaller file was written
    Skipped,   ///< Nothing smaller found, input too small, or run interrupted
    Failed     ///< A FileError (or unexpected exception) ended the task
};

const char* to_string(OutcomeStatus status);

/**
 * @brief Final result of one ImageTask.
 *
 * `optimized_size` is only meaningful for Optimized outcomes; for the
 * others it mirrors `original_size`.
 */
struct OptimizationOutcome {
    std::filesystem::path source_path;
    std::filesystem::path destination_path;
    ImageFormat format = ImageFormat::Jpeg;
    std::uintmax_t original_size = 0;
    std::uintmax_t optimized_size = 0;
    OutcomeStatus status = OutcomeStatus::Skipped;
    std::optional<FileErrorKind> error_kind;
    std::string error_detail;
    std::string skip_reason;
    std::chrono::milliseconds duration{0};

    /// @return Saved bytes as a percentage of the original (0 unless Optimized).
    [[nodiscard]] double saved_percent() const;
};

/**
 * @brief Running counters at the moment an outcome was recorded.
 */
struct ProgressSnapshot {
    std::size_t processed = 0;
    std::size_t succeeded = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::uintmax_t original_bytes = 0;
    std::uintmax_t optimized_bytes = 0;
};

/**
 * @brief Immutable totals of a run, produced by ProgressAggregator::summary().
 */
struct RunSummary {
    std::size_t processed = 0;
    std::size_t succeeded = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::uintmax_t original_bytes = 0;
    std::uintmax_t optimized_bytes = 0;
    std::vector<OptimizationOutcome> outcomes;  ///< In arrival order
    std::vector<OptimizationOutcome> failures;  ///< Subset of outcomes with status Failed
    bool cancelled = false;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] std::uintmax_t saved_bytes() const {
        return original_bytes > optimized_bytes ? original_bytes - optimized_bytes : 0;
    }

    [[nodiscard]] double saved_percent() const {
        return original_bytes ? 100.0 * static_cast<double>(saved_bytes()) / static_cast<double>(original_bytes)
                              : 0.0;
    }
};

} // namespace pixtrim

#endif // PIXTRIM_OUTCOME_HPP
