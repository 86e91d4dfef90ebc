//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef PIXTRIM_LOG_SINK_HPP
#define PIXTRIM_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages, ordered from most to least verbose.
 *
 * `None` is only meaningful as a sink threshold: a sink set to `None`
 * drops every message.
 */
enum class LogLevel {
    Debug,   ///< Per-file pipeline details (candidate sizes, chosen encodings)
    Info,    ///< Normal progress (file optimized, update found)
    Warning, ///< Skipped directories, codec warnings, recoverable oddities
    Error,   ///< Per-file failures and fatal setup problems
    None     ///< Threshold only: silence the sink
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file). Each sink
 * owns its own threshold; the Logger fans every message out to all sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Deliver a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (e.g. "executor").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // PIXTRIM_LOG_SINK_HPP
