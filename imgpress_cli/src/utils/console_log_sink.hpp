#ifndef IMGPRESS_CONSOLE_LOG_SINK_HPP
#define IMGPRESS_CONSOLE_LOG_SINK_HPP

#include "../../../libimgpress/include/log_sink.hpp"
#include <iostream>

/**
 * @brief Prints messages at or above log_level: Debug/Info to stdout,
 * Warning/Error to stderr.
 */
class ConsoleLogSink final : public imgpress::ILogSink {
public:
    imgpress::LogLevel log_level = imgpress::LogLevel::Info;

    void log(const imgpress::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        using imgpress::LogLevel;
        if (level < log_level) return;
        switch (level) {
            case LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }
};

#endif // IMGPRESS_CONSOLE_LOG_SINK_HPP
