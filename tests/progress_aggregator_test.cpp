//
// Created by Giuseppe Francione on 10/12/25.
//

#include <gtest/gtest.h>
#include "event_bus.hpp"
#include "events.hpp"
#include "progress_aggregator.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace pixtrim;

class ProgressAggregatorTest : public ::testing::Test {
protected:
    EventBus bus;
    ProgressAggregator aggregator{bus};

    static OptimizationOutcome make(const OutcomeStatus status, const std::uintmax_t before, const std::uintmax_t after) {
        OptimizationOutcome o;
        o.source_path = "f";
        o.status = status;
        o.original_size = before;
        o.optimized_size = after;
        if (status == OutcomeStatus::Failed) o.error_kind = FileErrorKind::DecodeError;
        return o;
    }
};

TEST_F(ProgressAggregatorTest, CountersAndBytes) {
    aggregator.record(make(OutcomeStatus::Optimized, 1000, 600));
    aggregator.record(make(OutcomeStatus::Skipped, 50, 50));
    aggregator.record(make(OutcomeStatus::Failed, 200, 200));

    const RunSummary s = aggregator.summary();
    EXPECT_EQ(s.processed, 3u);
    EXPECT_EQ(s.succeeded, 1u);
    EXPECT_EQ(s.skipped, 1u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_EQ(s.original_bytes, 1250u);
    EXPECT_EQ(s.optimized_bytes, 850u);
    EXPECT_EQ(s.saved_bytes(), 400u);
    ASSERT_EQ(s.failures.size(), 1u);
    EXPECT_EQ(s.outcomes.size(), 3u);
    EXPECT_FALSE(s.cancelled);
}

TEST_F(ProgressAggregatorTest, PublishesSnapshotPerRecord) {
    std::vector<std::size_t> seen;
    bus.subscribe<OutcomeRecordedEvent>([&](const OutcomeRecordedEvent& e) {
        seen.push_back(e.snapshot.processed);
    });
    aggregator.record(make(OutcomeStatus::Optimized, 10, 5));
    aggregator.record(make(OutcomeStatus::Skipped, 10, 10));
    EXPECT_EQ(seen, (std::vector<std::size_t>{1, 2}));
}

TEST_F(ProgressAggregatorTest, ConcurrentRecordsAreAllCounted) {
    constexpr int threads = 8;
    constexpr int per_thread = 250;
    std::atomic<int> events{0};
    bus.subscribe<OutcomeRecordedEvent>([&](const OutcomeRecordedEvent&) { ++events; });

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([this] {
            for (int i = 0; i < per_thread; ++i) {
                aggregator.record(make(OutcomeStatus::Optimized, 100, 40));
            }
        });
    }
    for (auto& w : workers) w.join();

    const RunSummary s = aggregator.summary();
    EXPECT_EQ(s.processed, static_cast<std::size_t>(threads * per_thread));
    EXPECT_EQ(s.original_bytes, static_cast<std::uintmax_t>(threads * per_thread * 100));
    EXPECT_EQ(s.optimized_bytes, static_cast<std::uintmax_t>(threads * per_thread * 40));
    EXPECT_EQ(events.load(), threads * per_thread);
}

TEST_F(ProgressAggregatorTest, CancelIsSticky) {
    aggregator.mark_cancelled();
    aggregator.record(make(OutcomeStatus::Skipped, 1, 1));
    EXPECT_TRUE(aggregator.summary().cancelled);
}
