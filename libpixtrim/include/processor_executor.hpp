//
// Created by Giuseppe Francione on 19/10/25.
//

/**
 * @file processor_executor.hpp
 * @brief Runs one optimization batch over the worker pool.
 */

#ifndef PIXTRIM_PROCESSOR_EXECUTOR_HPP
#define PIXTRIM_PROCESSOR_EXECUTOR_HPP

#include "event_bus.hpp"
#include "outcome.hpp"
#include "output_router.hpp"
#include "processor.hpp"
#include "progress_aggregator.hpp"
#include "run_config.hpp"
#include "thread_pool.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

namespace pixtrim {

/**
 * @brief Orchestrates scanning, per-file optimization and aggregation.
 *
 * @details run() walks the input with an ImageScanner, submits one task per
 * image to the ThreadPool and waits for all of them. Each task goes through:
 * read → minimal-size check → format resolution (libmagic + extension) →
 * optimize (resize included) → size guard → route → backup → atomic write.
 *
 * Any exception inside a task becomes a Failed outcome; the batch goes on.
 * Exactly one outcome is recorded per scanned file, including files that
 * were still queued when a stop was requested (Skipped, "Interrupted").
 */
class ProcessorExecutor {
public:
    /**
     * @param config Validated run configuration, shared read-only with every task.
     * @param aggregator Receives every outcome.
     * @param bus Scan and progress events are published here.
     */
    ProcessorExecutor(std::shared_ptr<const RunConfig> config,
                      ProgressAggregator& aggregator,
                      EventBus& bus);

    /**
     * @brief Process the whole input tree.
     * @throws ScanError if the input root cannot be walked.
     */
    RunSummary run();

    /**
     * @brief Execute a single task on the calling thread.
     * @return The outcome; never throws for per-file problems.
     */
    [[nodiscard]] OptimizationOutcome process(const ImageTask& task) const;

    /**
     * @brief Ask the running batch to stop.
     *
     * Only sets an atomic flag, so it is safe to call from a signal handler.
     * Scanning stops, queued tasks are recorded as interrupted, running
     * tasks complete.
     */
    void request_stop() noexcept { stop_flag_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool is_stopped() const noexcept {
        return stop_flag_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] unsigned worker_count() const noexcept { return pool_.size(); }

private:
    [[nodiscard]] OptimizationOutcome interrupted(const ImageTask& task) const;

    void keep_original(OptimizationOutcome& outcome, ByteView input, const std::string& reason) const;

    [[nodiscard]] bool inside_output_root(const std::filesystem::path& p) const;

    std::shared_ptr<const RunConfig> config_;
    ProgressAggregator& aggregator_;
    EventBus& event_bus_;
    OutputRouter router_;
    std::atomic<bool> stop_flag_{false};
    ThreadPool pool_; ///< Last member: workers are joined before the rest is destroyed
};

} // namespace pixtrim

#endif // PIXTRIM_PROCESSOR_EXECUTOR_HPP
