/**
 * @file directory_walker.hpp
 * @brief Enumeration of candidate image files, grouped per directory.
 */

#ifndef IMGPRESS_DIRECTORY_WALKER_HPP
#define IMGPRESS_DIRECTORY_WALKER_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace imgpress {

/**
 * @brief The image files found directly inside one directory.
 */
struct DirectoryBatch {
    std::filesystem::path directory;
    std::vector<std::filesystem::path> files; ///< sorted
};

/**
 * @brief Layout of a year-organized dataset:
 * {base}/{year_prefix}{year}/*{dir_suffix}/
 */
struct YearTreeLayout {
    std::filesystem::path base = "assets/enem_data";
    int start_year = 2009;
    int end_year = 2023;
    std::string year_prefix = "enem-";
    std::string dir_suffix = "-images";
};

/**
 * @brief Finds the files a run should process. Read-only on the filesystem.
 */
class DirectoryWalker {
public:
    /**
     * @brief True for names with a recognized image extension
     * (.png .jpg .jpeg .bmp .tiff .webp, any case) that are not junk files
     * ("._*" resource forks, .DS_Store, desktop.ini).
     */
    [[nodiscard]] static bool is_candidate(const std::filesystem::path& path);

    /**
     * @brief Candidate regular files directly inside @p directory, sorted.
     *
     * A missing or unreadable directory logs a warning and yields no files.
     */
    [[nodiscard]] static std::vector<std::filesystem::path> scan_directory(const std::filesystem::path& directory);

    /**
     * @brief One batch per "{dir_suffix}" subdirectory of every existing year directory.
     *
     * Years are visited in order; subdirectories within a year are sorted.
     * Missing year directories are logged and skipped; a missing base
     * directory is logged as an error and yields nothing.
     */
    [[nodiscard]] static std::vector<DirectoryBatch> walk_year_tree(const YearTreeLayout& layout);

    /**
     * @brief Batches for explicit inputs.
     *
     * Each directory becomes a batch (with @p recursive, every nested
     * directory too). Loose files are grouped by parent directory; junk
     * files are dropped, any other loose file is kept whatever its
     * extension. Missing inputs are logged and skipped.
     */
    [[nodiscard]] static std::vector<DirectoryBatch> collect_inputs(const std::vector<std::filesystem::path>& inputs,
                                                                    bool recursive);
};

} // namespace imgpress

#endif // IMGPRESS_DIRECTORY_WALKER_HPP
