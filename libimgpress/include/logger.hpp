/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * Every component of imgpress logs through Logger, which forwards each
 * message to the registered ILogSink implementations.
 */

#ifndef IMGPRESS_LOGGER_HPP
#define IMGPRESS_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace imgpress {

/**
 * @brief Global logging entry point.
 *
 * Sinks are owned by the Logger. All operations lock the same mutex, so a
 * sink never sees two messages at once.
 */
class Logger {
public:
    /**
     * @brief Add a sink. The Logger takes ownership.
     * @param sink Sink implementation; null sinks are ignored.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Emitting component (default: "imgpress").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "imgpress");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parse a level name, case-insensitively.
     *
     * Accepts DEBUG, INFO, WARN, WARNING and ERROR.
     * @return The level, or std::nullopt for anything else (e.g. "NONE").
     */
    static std::optional<LogLevel> string_to_level(std::string_view level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

} // namespace imgpress

#endif // IMGPRESS_LOGGER_HPP
