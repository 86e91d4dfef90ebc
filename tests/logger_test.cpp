//
// Created by Giuseppe Francione on 11/12/25.
//

#include <gtest/gtest.h>
#include "logger.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {
    struct Captured {
        LogLevel level;
        std::string message;
        std::string tag;
    };

    struct CaptureSink final : ILogSink {
        std::vector<Captured>* out;
        std::mutex* mtx;
        CaptureSink(std::vector<Captured>* o, std::mutex* m) : out(o), mtx(m) {}
        void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
            std::lock_guard lock(*mtx);
            out->push_back({level, std::string(message), std::string(tag)});
        }
    };
}

class LoggerTest : public ::testing::Test {
protected:
    std::vector<Captured> lines;
    std::mutex mtx;

    void SetUp() override {
        Logger::clear_sinks();
        Logger::add_sink(std::make_unique<CaptureSink>(&lines, &mtx));
    }

    void TearDown() override {
        Logger::clear_sinks();
    }
};

TEST_F(LoggerTest, ForwardsToSinks) {
    Logger::log(LogLevel::Warning, "disk almost full", "scanner");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].level, LogLevel::Warning);
    EXPECT_EQ(lines[0].message, "disk almost full");
    EXPECT_EQ(lines[0].tag, "scanner");
}

TEST_F(LoggerTest, DefaultTag) {
    Logger::log(LogLevel::Info, "hello");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].tag, "pixtrim");
}

TEST_F(LoggerTest, LevelNamesRoundTrip) {
    EXPECT_EQ(Logger::string_to_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::string_to_level("Warning"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("WARN"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("none"), LogLevel::None);
    EXPECT_FALSE(Logger::string_to_level("verbose").has_value());
    EXPECT_STREQ(Logger::level_to_string(LogLevel::Error), "ERROR");
}
