/**
 * @file file_utils.hpp
 * @brief Small filesystem helpers shared by codecs and the pipeline.
 */

#ifndef IMGPRESS_FILE_UTILS_HPP
#define IMGPRESS_FILE_UTILS_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>

namespace imgpress {

    /**
     * @brief Opens a file using a filesystem path.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief RAII wrapper for FILE pointers to ensure they are closed.
     */
    struct FileCloser {
        void operator()(FILE *f) const { if (f) std::fclose(f); }
    };
    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Unused path next to @p target for writing before the final rename.
     *
     * Pattern: "{target filename}.imgpress-{random}.tmp" in the same
     * directory, so the rename never crosses filesystems.
     */
    std::filesystem::path make_temp_sibling(const std::filesystem::path &target);

    /**
     * @brief File size, or std::nullopt if it cannot be read.
     */
    std::optional<std::uintmax_t> file_size_or_none(const std::filesystem::path &path);

} // namespace imgpress

#endif // IMGPRESS_FILE_UTILS_HPP
