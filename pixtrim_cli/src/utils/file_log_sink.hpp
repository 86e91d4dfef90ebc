//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef PIXTRIM_FILE_LOG_SINK_HPP
#define PIXTRIM_FILE_LOG_SINK_HPP

#include "../../../libpixtrim/include/log_sink.hpp"
#include "../../../libpixtrim/include/logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>

/**
 * @brief Appends timestamped lines to a log file. Records every level it is given.
 */
class FileLogSink final : public ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open() || level == LogLevel::None) return;

        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &now);
#else
        localtime_r(&now, &tm);
#endif
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

        std::lock_guard lock(mtx_);
        out_ << stamp << " [" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // PIXTRIM_FILE_LOG_SINK_HPP
