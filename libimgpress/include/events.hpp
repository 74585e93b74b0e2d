/**
 * @file events.hpp
 * @brief Progress events published by BatchExecutor.
 *
 * Plain data carriers used with EventBus; subscribers (CLI progress bar,
 * CSV report) read them and never modify the run.
 */

#ifndef IMGPRESS_EVENTS_HPP
#define IMGPRESS_EVENTS_HPP

#include "compression_result.hpp"
#include <cstddef>
#include <filesystem>
#include <string>

namespace imgpress {

// --- Directories ---

/**
 * @brief Emitted when the first file of a directory is queued.
 */
struct DirectoryStartEvent {
    std::filesystem::path directory;
    std::size_t file_count = 0;
};

/**
 * @brief Emitted when the last file of a directory has finished
 * (immediately for empty directories).
 */
struct DirectoryCompleteEvent {
    std::filesystem::path directory;
};

// --- Files ---

/**
 * @brief Emitted when a worker picks up a file.
 */
struct FileProcessStartEvent {
    std::filesystem::path path;
};

/**
 * @brief Emitted when a file was compressed successfully.
 */
struct FileProcessCompleteEvent {
    CompressionResult result;
};

/**
 * @brief Emitted when compressing a file failed.
 */
struct FileProcessErrorEvent {
    CompressionResult result;
};

/**
 * @brief Emitted when a file was not processed because a stop was requested.
 */
struct FileProcessSkippedEvent {
    std::filesystem::path path;
    std::string reason;
};

} // namespace imgpress

#endif // IMGPRESS_EVENTS_HPP
