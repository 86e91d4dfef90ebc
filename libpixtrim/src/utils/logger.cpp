//
// Created by Giuseppe Francione on 20/10/25.
//

#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    if (level == LogLevel::None) return;
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        sink->log(level, msg, tag);
    }
}

std::optional<LogLevel> Logger::string_to_level(std::string level) {
    std::ranges::transform(level, level.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (level == "DEBUG") return LogLevel::Debug;
    if (level == "INFO") return LogLevel::Info;
    if (level == "WARN" || level == "WARNING") return LogLevel::Warning;
    if (level == "ERROR") return LogLevel::Error;
    if (level == "NONE") return LogLevel::None;
    return std::nullopt;
}
