/**
 * @file path_planner.hpp
 * @brief Output path and backup/delete decisions for one input file.
 */

#ifndef IMGPRESS_PATH_PLANNER_HPP
#define IMGPRESS_PATH_PLANNER_HPP

#include "config.hpp"
#include "image_format.hpp"
#include <filesystem>

namespace imgpress {

/**
 * @brief Where the encoded file goes and what happens to the original.
 */
struct OutputPlan {
    enum class BackupMode {
        None,              ///< original is overwritten, deleted, or left alone
        SuffixedOutput,    ///< output gets output_suffix, original untouched
        RenameBeforeEncode ///< original renamed to backup_path, output takes its place
    };

    std::filesystem::path output_path;
    bool format_changed = false;
    BackupMode backup = BackupMode::None;
    std::filesystem::path backup_path; ///< set only for RenameBeforeEncode
    bool should_delete_original = false;

    /// True iff the original must be renamed to backup_path before encoding.
    [[nodiscard]] bool should_backup_original() const noexcept {
        return backup == BackupMode::RenameBeforeEncode;
    }

    bool operator==(const OutputPlan&) const = default;
};

/**
 * @brief Derives OutputPlan values. Pure: touches no files.
 */
class PathPlanner {
public:
    /**
     * @brief Plan the output for @p input_path.
     *
     * - format change: extension replaced by the target's canonical one,
     *   original deleted if delete_original_on_format_change and the paths differ;
     * - same format, backup_original, empty suffix: original renamed to
     *   "{input}.bak", output overwrites the input path;
     * - same format, backup_original: "{stem}{suffix}{ext}" next to the input;
     * - otherwise the input is overwritten in place.
     *
     * When the format is unchanged the input's own extension is kept.
     */
    [[nodiscard]] static OutputPlan plan(const std::filesystem::path& input_path,
                                         ImageFormat original_format,
                                         ImageFormat target_format,
                                         const CompressionConfig& config);
};

} // namespace imgpress

#endif // IMGPRESS_PATH_PLANNER_HPP
