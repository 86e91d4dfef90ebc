//
// Created by Giuseppe Francione on 14/12/25.
//

#include <gtest/gtest.h>
#include "logger.hpp"
#include "processor_registry.hpp"
#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

using namespace pixtrim;

namespace {
    struct MessageSink final : ILogSink {
        std::vector<std::string>* out;
        std::mutex* mtx;
        MessageSink(std::vector<std::string>* o, std::mutex* m) : out(o), mtx(m) {}
        void log(const LogLevel level, const std::string_view message, const std::string_view) override {
            if (level != LogLevel::Debug) return;
            std::lock_guard lock(*mtx);
            out->emplace_back(message);
        }
    };
}

class ProcessorRegistryTest : public ::testing::Test {
protected:
    std::vector<std::string> debug_lines;
    std::mutex mtx;

    void SetUp() override {
        Logger::clear_sinks();
        Logger::add_sink(std::make_unique<MessageSink>(&debug_lines, &mtx));
    }

    void TearDown() override {
        Logger::clear_sinks();
    }
};

TEST_F(ProcessorRegistryTest, EachFormatGetsItsProcessor) {
    EXPECT_TRUE(std::holds_alternative<JpegProcessor>(processor_for(ImageFormat::Jpeg)));
    EXPECT_TRUE(std::holds_alternative<PngProcessor>(processor_for(ImageFormat::Png)));
    EXPECT_TRUE(std::holds_alternative<WebpProcessor>(processor_for(ImageFormat::WebP)));
    EXPECT_TRUE(std::holds_alternative<SvgProcessor>(processor_for(ImageFormat::Svg)));
}

TEST_F(ProcessorRegistryTest, DispatchLogsTheProcessorThatRan) {
    const std::string svg = "<svg xmlns=\"http://www.w3.org/2000/svg\">  <!-- c -->  <rect/>  </svg>";
    const Bytes input(svg.begin(), svg.end());
    RunConfig config;
    config.input_root = "unused";

    const Bytes out = optimize_with(ImageFormat::Svg, input, config);
    EXPECT_LE(out.size(), input.size());

    const bool named = std::ranges::any_of(debug_lines, [](const std::string& line) {
        return line.starts_with("SvgProcessor: ");
    });
    EXPECT_TRUE(named);
}
