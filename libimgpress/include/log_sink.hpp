/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by Logger.
 */

#ifndef IMGPRESS_LOG_SINK_HPP
#define IMGPRESS_LOG_SINK_HPP

#include <string_view>

namespace imgpress {

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use these to filter or format output.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information
    Info,    ///< Normal progress (files compressed, directories entered)
    Warning, ///< Missing directories, unexpected but recoverable states
    Error    ///< Per-file failures and fatal configuration problems
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations define where log messages are delivered
 * (console, compression.log, a test buffer...).
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Deliver a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (e.g. "pipeline").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace imgpress

#endif // IMGPRESS_LOG_SINK_HPP
