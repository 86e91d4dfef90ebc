//
// Created by Giuseppe Francione on 11/12/25.
//

#include <gtest/gtest.h>
#include "backup_manager.hpp"
#include "event_bus.hpp"
#include "events.hpp"
#include "jpeg_processor.hpp"
#include "mime_detector.hpp"
#include "png_processor.hpp"
#include "processor_executor.hpp"
#include "progress_aggregator.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <memory>

using namespace pixtrim;
namespace fs = std::filesystem;

class ProcessorExecutorTest : public ::testing::Test {
protected:
    test::TempDir tmp;
    EventBus bus;
    ProgressAggregator aggregator{bus};

    fs::path in() const { return tmp.path() / "in"; }
    fs::path out() const { return tmp.path() / "out"; }

    void SetUp() override {
        fs::create_directories(in() / "nested");
    }

    RunConfig base_config() const {
        RunConfig cfg;
        cfg.input_root = in();
        cfg.recursive = true;
        cfg.quality = 70;
        cfg.threads = 2;
        cfg.png_zopfli = ZopfliPolicy::Never;
        return cfg;
    }

    RunSummary run(const RunConfig& cfg) {
        ProcessorExecutor executor(std::make_shared<const RunConfig>(cfg), aggregator, bus);
        return executor.run();
    }

    static const OptimizationOutcome& outcome_for(const RunSummary& s, const std::string& name) {
        const auto it = std::ranges::find_if(s.outcomes, [&](const OptimizationOutcome& o) {
            return o.source_path.filename() == name;
        });
        if (it == s.outcomes.end()) throw std::runtime_error("no outcome for " + name);
        return *it;
    }

    static std::size_t occurrences(const std::string& haystack, const std::string& needle) {
        std::size_t count = 0;
        for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
            ++count;
        }
        return count;
    }

    void write_fixtures() const {
        test::write_bytes(in() / "photo.jpg", JpegProcessor::encode(test::make_gradient(160, 120, 3), 100));
        test::write_bytes(in() / "nested" / "icon.png", PngProcessor::encode(test::make_gradient(64, 64, 4), 0));
    }
};

TEST_F(ProcessorExecutorTest, InPlaceRunShrinksFiles) {
    write_fixtures();
    const auto jpg_before = fs::file_size(in() / "photo.jpg");
    const auto png_before = fs::file_size(in() / "nested" / "icon.png");

    const RunSummary s = run(base_config());

    EXPECT_EQ(s.processed, 2u);
    EXPECT_EQ(s.succeeded, 2u);
    EXPECT_EQ(s.failed, 0u);
    EXPECT_FALSE(s.cancelled);
    EXPECT_LT(fs::file_size(in() / "photo.jpg"), jpg_before);
    EXPECT_LT(fs::file_size(in() / "nested" / "icon.png"), png_before);
    EXPECT_EQ(s.original_bytes, jpg_before + png_before);
    EXPECT_GT(s.saved_bytes(), 0u);
    EXPECT_FALSE(fs::exists(backup_path_for(in() / "photo.jpg")));
}

TEST_F(ProcessorExecutorTest, LargeJpegComesBackUnderHalfAMegabyte) {
    const Bytes photo = JpegProcessor::encode(test::make_noise(800, 600, 3), 100);
    ASSERT_GE(photo.size(), 500000u);
    test::write_bytes(in() / "large.jpg", photo);

    const RunSummary s = run(base_config());

    ASSERT_EQ(s.processed, 1u);
    const auto& o = outcome_for(s, "large.jpg");
    EXPECT_EQ(o.status, OutcomeStatus::Optimized);
    EXPECT_EQ(o.original_size, photo.size());
    EXPECT_LT(o.optimized_size, 500000u);
    EXPECT_EQ(fs::file_size(in() / "large.jpg"), o.optimized_size);
}

TEST_F(ProcessorExecutorTest, TinyStubIsSkippedAndUntouched) {
    const std::vector<std::uint8_t> stub{0x89, 'P', 'N', 'G', 1, 2, 3, 4, 5, 6};
    test::write_bytes(in() / "stub.png", stub);

    const RunSummary s = run(base_config());

    ASSERT_EQ(s.processed, 1u);
    const auto& o = outcome_for(s, "stub.png");
    EXPECT_EQ(o.status, OutcomeStatus::Skipped);
    EXPECT_EQ(o.optimized_size, o.original_size);
    EXPECT_EQ(test::read_bytes(in() / "stub.png"), stub);
}

TEST_F(ProcessorExecutorTest, NeverWritesLargerOutput) {
    const std::string svg = "<svg/>";
    test::write_text(in() / "min.svg", svg);

    const RunSummary s = run(base_config());

    const auto& o = outcome_for(s, "min.svg");
    EXPECT_EQ(o.status, OutcomeStatus::Skipped);
    EXPECT_EQ(fs::file_size(in() / "min.svg"), svg.size());
}

TEST_F(ProcessorExecutorTest, BackupKeepsOriginalBytes) {
    write_fixtures();
    const auto original = test::read_bytes(in() / "photo.jpg");
    RunConfig cfg = base_config();
    cfg.backup = true;

    (void) run(cfg);

    EXPECT_EQ(test::read_bytes(backup_path_for(in() / "photo.jpg")), original);
    EXPECT_NE(test::read_bytes(in() / "photo.jpg"), original);
}

TEST_F(ProcessorExecutorTest, MirroredRunLeavesSourcesAlone) {
    write_fixtures();
    test::write_text(in() / "min.svg", "<svg/>");
    const auto original = test::read_bytes(in() / "nested" / "icon.png");
    RunConfig cfg = base_config();
    cfg.output_root = out();

    const RunSummary s = run(cfg);

    EXPECT_EQ(s.processed, 3u);
    EXPECT_EQ(test::read_bytes(in() / "nested" / "icon.png"), original);
    EXPECT_TRUE(fs::exists(out() / "photo.jpg"));
    EXPECT_TRUE(fs::exists(out() / "nested" / "icon.png"));
    // skipped files are still copied so the mirror is complete
    EXPECT_EQ(test::read_bytes(out() / "min.svg"), test::read_bytes(in() / "min.svg"));
    EXPECT_LT(fs::file_size(out() / "nested" / "icon.png"), original.size());
}

TEST_F(ProcessorExecutorTest, CorruptFileFailsWithoutStoppingTheRun) {
    write_fixtures();
    test::write_bytes(in() / "broken.png", std::vector<std::uint8_t>(300, 0x5A));

    const RunSummary s = run(base_config());

    EXPECT_EQ(s.processed, 3u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_EQ(s.succeeded, 2u);
    const auto& o = outcome_for(s, "broken.png");
    EXPECT_EQ(o.status, OutcomeStatus::Failed);
    ASSERT_TRUE(o.error_kind.has_value());
    EXPECT_EQ(*o.error_kind, FileErrorKind::DecodeError);
    EXPECT_EQ(occurrences(o.error_detail, (in() / "broken.png").string()), 1u);
    EXPECT_EQ(fs::file_size(in() / "broken.png"), 300u);
}

TEST_F(ProcessorExecutorTest, ContentTypeMismatchIsReported) {
    const auto png = PngProcessor::encode(test::make_gradient(32, 32, 3), 0);
    if (MimeDetector::detect(png).empty()) {
        GTEST_SKIP() << "magic database not available";
    }
    test::write_bytes(in() / "fake.jpg", png);

    const RunSummary s = run(base_config());

    const auto& o = outcome_for(s, "fake.jpg");
    EXPECT_EQ(o.status, OutcomeStatus::Failed);
    EXPECT_EQ(o.error_kind, FileErrorKind::FormatMismatch);
    EXPECT_EQ(occurrences(o.error_detail, (in() / "fake.jpg").string()), 1u);
    EXPECT_EQ(test::read_bytes(in() / "fake.jpg"), png);
}

TEST_F(ProcessorExecutorTest, StopBeforeRunProcessesNothing) {
    write_fixtures();
    const auto original = test::read_bytes(in() / "photo.jpg");

    ProcessorExecutor executor(std::make_shared<const RunConfig>(base_config()), aggregator, bus);
    executor.request_stop();
    const RunSummary s = executor.run();

    EXPECT_TRUE(s.cancelled);
    EXPECT_EQ(s.succeeded, 0u);
    EXPECT_EQ(test::read_bytes(in() / "photo.jpg"), original);
}

TEST_F(ProcessorExecutorTest, PublishesQueueAndScanEvents) {
    write_fixtures();
    std::size_t queued = 0;
    std::size_t total = 0;
    bus.subscribe<FileQueuedEvent>([&](const FileQueuedEvent& e) { queued = e.queued_so_far; });
    bus.subscribe<ScanCompleteEvent>([&](const ScanCompleteEvent& e) { total = e.total_files; });

    (void) run(base_config());

    EXPECT_EQ(queued, 2u);
    EXPECT_EQ(total, 2u);
}

TEST_F(ProcessorExecutorTest, OutputTreeInsideInputIsNotRescanned) {
    write_fixtures();
    RunConfig cfg = base_config();
    cfg.output_root = in() / "optimized";
    fs::create_directories(*cfg.output_root);
    test::write_bytes(*cfg.output_root / "old.jpg", JpegProcessor::encode(test::make_gradient(32, 32, 3), 100));

    const RunSummary s = run(cfg);

    EXPECT_EQ(s.processed, 2u);
}
