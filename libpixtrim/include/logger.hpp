//
// Created by Giuseppe Francione on 20/10/25.
//

/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade shared by the library and the CLI.
 */

#ifndef PIXTRIM_LOGGER_HPP
#define PIXTRIM_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Global logging entry point.
 *
 * Worker threads, codec callbacks and the updater all log through here.
 * Messages are delivered to every registered sink under a single lock,
 * so lines from concurrent workers never interleave.
 */
class Logger {
public:
    /**
     * @brief Register a sink. The Logger takes ownership.
     * @param sink Sink implementation; null pointers are ignored.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /// @brief Remove all configured sinks.
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "pixtrim").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "pixtrim");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::None:    return "NONE";
        }
        return "";
    }

    /**
     * @brief Parse a level name as accepted by `--log-level`.
     *
     * Case-insensitive; both "WARN" and "WARNING" are accepted.
     * @return The level, or std::nullopt for an unknown name.
     */
    static std::optional<LogLevel> string_to_level(std::string level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

#endif // PIXTRIM_LOGGER_HPP
