//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef PIXTRIM_CONSOLE_LOG_SINK_HPP
#define PIXTRIM_CONSOLE_LOG_SINK_HPP

#include "../../../libpixtrim/include/log_sink.hpp"
#include "color.hpp"
#include <iostream>

/**
 * @brief Writes messages at or above `log_level` to stderr.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Warning;
    bool use_colors = true;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level == LogLevel::None || log_level == LogLevel::None || level < log_level) return;

        const char* color = "";
        const char* label = "";
        switch (level) {
            case LogLevel::Debug:   color = GRAY;   label = "[DEBUG]"; break;
            case LogLevel::Info:    color = CYAN;   label = "[INFO ]"; break;
            case LogLevel::Warning: color = YELLOW; label = "[WARN ]"; break;
            case LogLevel::Error:   color = RED;    label = "[ERROR]"; break;
            case LogLevel::None:    return;
        }
        if (use_colors) std::cerr << color;
        std::cerr << "\n" << label << "[" << tag << "] " << message;
        if (use_colors) std::cerr << RESET;
        std::cerr << std::endl;
    }
};

#endif // PIXTRIM_CONSOLE_LOG_SINK_HPP
