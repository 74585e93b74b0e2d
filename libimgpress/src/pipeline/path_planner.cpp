#include "../../include/path_planner.hpp"

namespace imgpress {

OutputPlan PathPlanner::plan(const std::filesystem::path& input_path,
                             const ImageFormat original_format,
                             const ImageFormat target_format,
                             const CompressionConfig& config) {
    OutputPlan plan;
    plan.format_changed = original_format != target_format;

    if (plan.format_changed) {
        plan.output_path = input_path;
        plan.output_path.replace_extension(canonical_extension(target_format));
        plan.should_delete_original = config.delete_original_on_format_change &&
                                      plan.output_path != input_path;
        return plan;
    }

    if (config.backup_original && config.output_suffix.empty()) {
        plan.output_path = input_path;
        plan.backup = OutputPlan::BackupMode::RenameBeforeEncode;
        plan.backup_path = input_path;
        plan.backup_path += ".bak";
        return plan;
    }

    if (config.backup_original) {
        const std::string name = input_path.stem().string() + config.output_suffix +
                                 input_path.extension().string();
        plan.output_path = input_path.parent_path() / name;
        plan.backup = OutputPlan::BackupMode::SuffixedOutput;
        return plan;
    }

    plan.output_path = input_path;
    return plan;
}

} // namespace imgpress
