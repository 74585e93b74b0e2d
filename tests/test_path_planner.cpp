#include "../libimgpress/include/path_planner.hpp"
#include <gtest/gtest.h>

using namespace imgpress;
namespace fs = std::filesystem;

namespace {

CompressionConfig make_config(const bool backup, const std::string& suffix, const bool delete_on_change = true) {
    CompressionConfig c;
    c.backup_original = backup;
    c.output_suffix = suffix;
    c.delete_original_on_format_change = delete_on_change;
    return c;
}

} // namespace

TEST(PathPlanner, FormatChangeReplacesExtensionAndDeletes) {
    const auto plan = PathPlanner::plan("/data/a/photo.png", ImageFormat::Png, ImageFormat::Jpeg,
                                        make_config(false, "_compressed"));
    EXPECT_EQ(plan.output_path, fs::path("/data/a/photo.jpg"));
    EXPECT_TRUE(plan.format_changed);
    EXPECT_TRUE(plan.should_delete_original);
    EXPECT_FALSE(plan.should_backup_original());
    EXPECT_EQ(plan.backup, OutputPlan::BackupMode::None);
}

TEST(PathPlanner, FormatChangeWithoutDeleteFlagKeepsOriginal) {
    const auto plan = PathPlanner::plan("/data/photo.bmp", ImageFormat::Bmp, ImageFormat::Webp,
                                        make_config(false, "_compressed", false));
    EXPECT_EQ(plan.output_path, fs::path("/data/photo.webp"));
    EXPECT_TRUE(plan.format_changed);
    EXPECT_FALSE(plan.should_delete_original);
}

TEST(PathPlanner, FormatChangeWinsOverBackup) {
    const auto plan = PathPlanner::plan("/data/photo.png", ImageFormat::Png, ImageFormat::Jpeg,
                                        make_config(true, "_compressed"));
    EXPECT_EQ(plan.output_path, fs::path("/data/photo.jpg"));
    EXPECT_TRUE(plan.should_delete_original);
    EXPECT_EQ(plan.backup, OutputPlan::BackupMode::None);
}

TEST(PathPlanner, UnknownExtensionCountsAsFormatChange) {
    const auto plan = PathPlanner::plan("/data/scan.dat", ImageFormat::Unknown, ImageFormat::Png,
                                        make_config(false, "_compressed"));
    EXPECT_TRUE(plan.format_changed);
    EXPECT_EQ(plan.output_path, fs::path("/data/scan.png"));
}

TEST(PathPlanner, SameFormatNoBackupIsInPlace) {
    const auto plan = PathPlanner::plan("/data/photo.jpeg", ImageFormat::Jpeg, ImageFormat::Jpeg,
                                        make_config(false, "_compressed"));
    EXPECT_EQ(plan.output_path, fs::path("/data/photo.jpeg"));
    EXPECT_FALSE(plan.format_changed);
    EXPECT_FALSE(plan.should_delete_original);
    EXPECT_FALSE(plan.should_backup_original());
}

TEST(PathPlanner, BackupWithSuffixWritesSiblingAndKeepsExtension) {
    const auto plan = PathPlanner::plan("/data/photo.JPG", ImageFormat::Jpeg, ImageFormat::Jpeg,
                                        make_config(true, "_compressed"));
    EXPECT_EQ(plan.output_path, fs::path("/data/photo_compressed.JPG"));
    EXPECT_EQ(plan.backup, OutputPlan::BackupMode::SuffixedOutput);
    EXPECT_FALSE(plan.should_backup_original());
    EXPECT_FALSE(plan.should_delete_original);
}

TEST(PathPlanner, BackupWithEmptySuffixRenamesBeforeEncode) {
    const auto plan = PathPlanner::plan("/data/photo.jpg", ImageFormat::Jpeg, ImageFormat::Jpeg,
                                        make_config(true, ""));
    EXPECT_TRUE(plan.should_backup_original());
    EXPECT_EQ(plan.backup_path, fs::path("/data/photo.jpg.bak"));
    EXPECT_EQ(plan.output_path, fs::path("/data/photo.jpg"));
    EXPECT_FALSE(plan.should_delete_original);
}

TEST(PathPlanner, IsDeterministic) {
    const auto config = make_config(true, "_small");
    const auto a = PathPlanner::plan("/x/y/z.webp", ImageFormat::Webp, ImageFormat::Webp, config);
    const auto b = PathPlanner::plan("/x/y/z.webp", ImageFormat::Webp, ImageFormat::Webp, config);
    EXPECT_EQ(a, b);
}
