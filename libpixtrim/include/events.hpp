//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef PIXTRIM_EVENTS_HPP
#define PIXTRIM_EVENTS_HPP

#include "outcome.hpp"
#include "updater/update_state.hpp"
#include <cstddef>
#include <filesystem>
#include <string>

namespace pixtrim {

/**
 * @brief Events published on the EventBus during a run.
 *
 * Plain data carriers. The CLI subscribes to drive the progress bar,
 * the per-file lines and the final report.
 */

// --- Scan ---

/**
 * @brief A directory or entry under the input root could not be read and was skipped.
 */
struct ScanWarningEvent {
    std::filesystem::path path;
    std::string message;
};

/**
 * @brief Emitted by the executor every time a file is handed to the pool.
 */
struct FileQueuedEvent {
    std::filesystem::path path;
    std::size_t queued_so_far = 0;
};

/**
 * @brief Emitted once the scan is exhausted (or stopped) and the total is known.
 */
struct ScanCompleteEvent {
    std::size_t total_files = 0;
    bool stopped = false;
};

// --- Processing ---

struct FileProcessStartEvent {
    std::filesystem::path path;
};

/**
 * @brief Emitted by the ProgressAggregator after recording an outcome.
 *
 * Carries the counters as they were right after this outcome, so
 * subscribers never read the aggregator concurrently.
 */
struct OutcomeRecordedEvent {
    OptimizationOutcome outcome;
    ProgressSnapshot snapshot;
};

// --- Self-update ---

struct UpdateStateChangedEvent {
    UpdateState state;
    std::string detail; ///< Version, asset name or error text, depending on the state
};

} // namespace pixtrim

#endif // PIXTRIM_EVENTS_HPP
