//
// Created by Giuseppe Francione on 04/12/25.
//

#ifndef PIXTRIM_PROGRESS_AGGREGATOR_HPP
#define PIXTRIM_PROGRESS_AGGREGATOR_HPP

#include "event_bus.hpp"
#include "outcome.hpp"
#include <chrono>
#include <mutex>

namespace pixtrim {

    /**
     * @brief Thread-safe collector of per-file outcomes.
     *
     * Workers call record() in any order. Each call updates the running
     * totals under the lock and then publishes an OutcomeRecordedEvent with
     * a copy of the totals, outside the lock.
     */
    class ProgressAggregator {
    public:
        explicit ProgressAggregator(EventBus& bus);

        void record(OptimizationOutcome outcome);

        void mark_cancelled();

        /// Totals, all outcomes, failures, cancelled flag and time since construction.
        [[nodiscard]] RunSummary summary() const;

    private:
        EventBus& bus_;
        mutable std::mutex mutex_;
        RunSummary summary_;
        std::chrono::steady_clock::time_point started_;
    };

} // namespace pixtrim

#endif // PIXTRIM_PROGRESS_AGGREGATOR_HPP
