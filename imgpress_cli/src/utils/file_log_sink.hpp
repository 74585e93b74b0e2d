#ifndef IMGPRESS_FILE_LOG_SINK_HPP
#define IMGPRESS_FILE_LOG_SINK_HPP

#include "../../../libimgpress/include/log_sink.hpp"
#include "../../../libimgpress/include/logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>

/**
 * @brief Appends every message to a log file, one timestamped line each:
 * "2024-05-01 10:00:00 [INFO][pipeline] message".
 */
class FileLogSink final : public imgpress::ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const imgpress::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);

        std::lock_guard lock(mtx_);
        out_ << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
             << " [" << imgpress::Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // IMGPRESS_FILE_LOG_SINK_HPP
