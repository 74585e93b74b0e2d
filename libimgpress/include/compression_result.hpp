/**
 * @file compression_result.hpp
 * @brief Outcome of compressing one file.
 */

#ifndef IMGPRESS_COMPRESSION_RESULT_HPP
#define IMGPRESS_COMPRESSION_RESULT_HPP

#include "errors.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace imgpress {

/**
 * @brief Per-file result handed to StatsAggregator and the event bus.
 *
 * original_size is filled as soon as the input could be stat'ed, even if a
 * later step failed; compressed_size only on success.
 */
struct CompressionResult {
    std::filesystem::path input_path;
    std::filesystem::path output_path;
    bool success = false;
    std::uintmax_t original_size = 0;
    std::uintmax_t compressed_size = 0;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    bool format_changed = false;
    bool original_deleted = false;
    std::chrono::milliseconds duration{0};

    /// 1 - compressed/original, 0 when nothing was read or written.
    [[nodiscard]] double compression_ratio() const noexcept {
        if (!success || original_size == 0) return 0.0;
        return 1.0 - static_cast<double>(compressed_size) / static_cast<double>(original_size);
    }
};

} // namespace imgpress

#endif // IMGPRESS_COMPRESSION_RESULT_HPP
