//
// Created by Giuseppe Francione on 04/12/25.
//

#include "../../include/progress_aggregator.hpp"
#include "../../include/events.hpp"
#include <utility>

namespace pixtrim {

namespace {

    ProgressSnapshot snapshot_of(const RunSummary& s) {
        return {s.processed, s.succeeded, s.skipped, s.failed, s.original_bytes, s.optimized_bytes};
    }

} // namespace

ProgressAggregator::ProgressAggregator(EventBus& bus)
    : bus_(bus), started_(std::chrono::steady_clock::now()) {}

void ProgressAggregator::record(OptimizationOutcome outcome) {
    ProgressSnapshot snap;
    {
        std::lock_guard lock(mutex_);
        ++summary_.processed;
        summary_.original_bytes += outcome.original_size;
        switch (outcome.status) {
            case OutcomeStatus::Optimized:
                ++summary_.succeeded;
                summary_.optimized_bytes += outcome.optimized_size;
                break;
            case OutcomeStatus::Skipped:
                ++summary_.skipped;
                summary_.optimized_bytes += outcome.original_size;
                break;
            case OutcomeStatus::Failed:
                ++summary_.failed;
                summary_.optimized_bytes += outcome.original_size;
                summary_.failures.push_back(outcome);
                break;
        }
        summary_.outcomes.push_back(outcome);
        snap = snapshot_of(summary_);
    }
    bus_.publish(OutcomeRecordedEvent{std::move(outcome), snap});
}

void ProgressAggregator::mark_cancelled() {
    std::lock_guard lock(mutex_);
    summary_.cancelled = true;
}

RunSummary ProgressAggregator::summary() const {
    std::lock_guard lock(mutex_);
    RunSummary copy = summary_;
    copy.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    return copy;
}

} // namespace pixtrim
