#include "../libimgpress/include/config.hpp"
#include "../libimgpress/include/errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

using namespace imgpress;
using namespace imgpress::test;

TEST(CompressionConfig, Defaults) {
    const CompressionConfig c;
    EXPECT_EQ(c.quality, 85);
    EXPECT_EQ(c.format, "JPEG");
    EXPECT_FALSE(c.max_width.has_value());
    EXPECT_FALSE(c.max_height.has_value());
    EXPECT_TRUE(c.optimize);
    EXPECT_TRUE(c.progressive);
    EXPECT_FALSE(c.backup_original);
    EXPECT_EQ(c.output_suffix, "_compressed");
    EXPECT_TRUE(c.delete_original_on_format_change);
    EXPECT_NO_THROW(c.validate());
    EXPECT_EQ(c.target_format(), ImageFormat::Jpeg);
}

TEST(CompressionConfig, SaveThenLoad) {
    TempDir dir;
    CompressionConfig out;
    out.quality = 70;
    out.format = "WEBP";
    out.max_width = 1920;
    out.backup_original = true;
    out.output_suffix = "";
    ASSERT_TRUE(out.save_to_yaml(dir / "c.yaml"));

    CompressionConfig in;
    ASSERT_TRUE(in.load_from_yaml(dir / "c.yaml"));
    EXPECT_EQ(in.quality, 70);
    EXPECT_EQ(in.format, "WEBP");
    EXPECT_EQ(in.max_width, 1920);
    EXPECT_FALSE(in.max_height.has_value());
    EXPECT_TRUE(in.backup_original);
    EXPECT_EQ(in.output_suffix, "");
}

TEST(CompressionConfig, NullSizesClearCaps) {
    CompressionConfig c;
    c.max_width = 100;
    c.max_height = 100;
    c.load_from_node(YAML::Load("{max_width: null, max_height: ~}"));
    EXPECT_FALSE(c.max_width.has_value());
    EXPECT_FALSE(c.max_height.has_value());
}

TEST(CompressionConfig, MissingKeysKeepCurrentValues) {
    CompressionConfig c;
    c.max_width = 640;
    c.load_from_node(YAML::Load("quality: 50"));
    EXPECT_EQ(c.quality, 50);
    EXPECT_EQ(c.max_width, 640);
    EXPECT_EQ(c.format, "JPEG");
}

TEST(CompressionConfig, LoadsJsonFile) {
    TempDir dir;
    write_bytes(dir / "c.json",
                R"({"quality": 60, "format": "PNG", "max_width": null, "max_height": 720,
                    "optimize": false, "progressive": false, "backup_original": false,
                    "output_suffix": "_small", "delete_original_on_format_change": false})");
    CompressionConfig c;
    ASSERT_TRUE(c.load_from_yaml(dir / "c.json"));
    EXPECT_EQ(c.quality, 60);
    EXPECT_EQ(c.target_format(), ImageFormat::Png);
    EXPECT_EQ(c.max_height, 720);
    EXPECT_FALSE(c.optimize);
    EXPECT_EQ(c.output_suffix, "_small");
    EXPECT_FALSE(c.delete_original_on_format_change);
}

TEST(CompressionConfig, UnparseableFileLeavesConfigUnchanged) {
    TempDir dir;
    write_bytes(dir / "bad.yaml", "quality: [unterminated\n");
    CompressionConfig c;
    c.quality = 42;
    EXPECT_FALSE(c.load_from_yaml(dir / "bad.yaml"));
    EXPECT_EQ(c.quality, 42);
}

TEST(CompressionConfig, WrongTypeIsRejected) {
    TempDir dir;
    write_bytes(dir / "bad.yaml", "quality: high\nformat: PNG\n");
    CompressionConfig c;
    EXPECT_FALSE(c.load_from_yaml(dir / "bad.yaml"));
    EXPECT_EQ(c.format, "JPEG");
}

TEST(CompressionConfig, MissingFileFails) {
    TempDir dir;
    CompressionConfig c;
    EXPECT_FALSE(c.load_from_yaml(dir / "nope.yaml"));
}

TEST(CompressionConfig, ValidateRejectsOutOfRangeValues) {
    auto expect_invalid = [](const CompressionConfig& c) {
        try {
            c.validate();
            ADD_FAILURE() << "expected ConfigError";
        } catch (const ConfigError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::InvalidConfig);
        }
    };

    CompressionConfig c;
    c.quality = 0;
    expect_invalid(c);
    c.quality = 101;
    expect_invalid(c);

    c = CompressionConfig{};
    c.max_width = 0;
    expect_invalid(c);

    c = CompressionConfig{};
    c.max_height = -5;
    expect_invalid(c);
}

TEST(CompressionConfig, ValidateRejectsUnknownFormat) {
    CompressionConfig c;
    c.format = "gif";
    try {
        c.validate();
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedFormat);
    }
}

TEST(CompressionConfig, FormatNamesAreCaseInsensitive) {
    CompressionConfig c;
    c.format = "jpg";
    EXPECT_EQ(c.target_format(), ImageFormat::Jpeg);
    c.format = "Tif";
    EXPECT_EQ(c.target_format(), ImageFormat::Tiff);
    c.format = "bmp";
    EXPECT_EQ(c.target_format(), ImageFormat::Bmp);
}
