/**
 * @file mime_detector.hpp
 * @brief Content-based file type detection.
 */

#ifndef IMGPRESS_MIME_DETECTOR_HPP
#define IMGPRESS_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace imgpress {

    /**
     * @brief Detects MIME types from file contents with libmagic.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * Uses the system magic database. Each call opens its own libmagic
         * cookie, so it is safe from any thread.
         *
         * @param path The filesystem path to the file.
         * @return A MIME type string (e.g. "image/jpeg"), or an empty string
         * if libmagic is unavailable or the file cannot be read.
         */
        static std::string detect(const std::filesystem::path& path);
    };

} // namespace imgpress

#endif // IMGPRESS_MIME_DETECTOR_HPP
