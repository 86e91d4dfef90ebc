//
// Created by Giuseppe Francione on 13/12/25.
//

#include <gtest/gtest.h>
#include "../pixtrim_cli/src/report/report_generator.hpp"
#include <algorithm>
#include <sstream>
#include <string>

using namespace pixtrim;

class ReportGeneratorTest : public ::testing::Test {};

TEST_F(ReportGeneratorTest, EscapesOnlyWhenNeeded) {
    EXPECT_EQ(csv_escape("plain.png"), "plain.png");
    EXPECT_EQ(csv_escape("a,b.png"), "\"a,b.png\"");
    EXPECT_EQ(csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"");
}

TEST_F(ReportGeneratorTest, CsvHasHeaderAndOneRowPerOutcome) {
    RunSummary summary;
    OptimizationOutcome ok;
    ok.source_path = "in/a.png";
    ok.destination_path = "in/a.png";
    ok.format = ImageFormat::Png;
    ok.original_size = 1000;
    ok.optimized_size = 750;
    ok.status = OutcomeStatus::Optimized;
    summary.outcomes.push_back(ok);

    OptimizationOutcome bad;
    bad.source_path = "in/b,c.jpg";
    bad.destination_path = "in/b,c.jpg";
    bad.original_size = 500;
    bad.status = OutcomeStatus::Failed;
    bad.error_kind = FileErrorKind::DecodeError;
    bad.error_detail = "in/b,c.jpg: truncated";
    summary.outcomes.push_back(bad);

    std::ostringstream out;
    write_csv(summary, out);
    const std::string csv = out.str();

    EXPECT_EQ(csv.rfind("File,Destination,Format,Before(bytes),After(bytes),Saved(%),Time(s),Result,Detail\n", 0), 0u);
    EXPECT_NE(csv.find("in/a.png,in/a.png,png,1000,750,25.00,"), std::string::npos);
    EXPECT_NE(csv.find("\"in/b,c.jpg\""), std::string::npos);
    EXPECT_EQ(std::count(csv.begin(), csv.end(), '\n'), 3);
}
