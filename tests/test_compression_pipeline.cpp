#include "../libimgpress/include/compression_pipeline.hpp"
#include "../libimgpress/include/errors.hpp"
#include "../libimgpress/include/jpeg_codec.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <stop_token>

using namespace imgpress;
using namespace imgpress::test;
namespace fs = std::filesystem;

namespace {

class CompressionPipelineTest : public ::testing::Test {
protected:
    TempDir dir;
    CodecRegistry registry;
    CompressionConfig config;

    CompressionResult run(const fs::path& input) const {
        const CompressionPipeline pipeline(config, registry);
        return pipeline.process(input);
    }

    fs::path write_jpeg(const std::string& name, const RasterImage& image) const {
        EncodeParams p;
        p.format = ImageFormat::Jpeg;
        p.quality = 95;
        JpegCodec{}.encode(image, dir / name, p);
        return dir / name;
    }

    std::vector<std::string> entries() const {
        std::vector<std::string> names;
        for (const auto& e : fs::directory_iterator(dir.path())) names.push_back(e.path().filename().string());
        std::ranges::sort(names);
        return names;
    }
};

} // namespace

TEST_F(CompressionPipelineTest, LargePngBecomesResizedJpegAndOriginalIsDeleted) {
    config.max_width = 1920;
    const auto input = write_png(dir / "page.png", make_gradient(2400, 1600));

    const auto r = run(input);
    ASSERT_TRUE(r.success) << r.error_message;
    EXPECT_EQ(r.output_path, dir / "page.jpg");
    EXPECT_TRUE(r.format_changed);
    EXPECT_TRUE(r.original_deleted);
    EXPECT_FALSE(fs::exists(input));
    EXPECT_GT(r.original_size, 0u);
    EXPECT_EQ(r.compressed_size, fs::file_size(dir / "page.jpg"));

    const auto out = JpegCodec{}.decode(dir / "page.jpg");
    EXPECT_EQ(out.width, 1920u);
    EXPECT_EQ(out.height, 1280u);
    EXPECT_EQ(entries(), std::vector<std::string>{"page.jpg"});
}

TEST_F(CompressionPipelineTest, FormatChangeKeepsOriginalWhenDeleteIsOff) {
    config.delete_original_on_format_change = false;
    const auto input = write_png(dir / "a.png", make_gradient(20, 10, ColorMode::Rgba));

    const auto r = run(input);
    ASSERT_TRUE(r.success) << r.error_message;
    EXPECT_FALSE(r.original_deleted);
    EXPECT_TRUE(fs::exists(input));
    EXPECT_TRUE(fs::exists(dir / "a.jpg"));
}

TEST_F(CompressionPipelineTest, SameFormatIsRewrittenInPlace) {
    config.format = "PNG";
    const auto input = write_png(dir / "same.png", make_gradient(30, 30));

    const auto r = run(input);
    ASSERT_TRUE(r.success) << r.error_message;
    EXPECT_FALSE(r.format_changed);
    EXPECT_FALSE(r.original_deleted);
    EXPECT_EQ(r.output_path, input);
    EXPECT_EQ(entries(), std::vector<std::string>{"same.png"});
}

TEST_F(CompressionPipelineTest, JpgExtensionCountsAsJpeg) {
    const auto input = write_jpeg("photo.jpeg", make_random(40, 40, 1));
    const auto r = run(input);
    ASSERT_TRUE(r.success) << r.error_message;
    EXPECT_FALSE(r.format_changed);
    EXPECT_EQ(r.output_path, input);
}

TEST_F(CompressionPipelineTest, ZeroByteFileIsDecodeError) {
    write_bytes(dir / "empty.png", "");
    const auto r = run(dir / "empty.png");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, ErrorKind::DecodeError);
    EXPECT_EQ(r.original_size, 0u);
    EXPECT_TRUE(fs::exists(dir / "empty.png"));
}

TEST_F(CompressionPipelineTest, MissingFileIsNotFound) {
    const auto r = run(dir / "ghost.png");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, ErrorKind::NotFound);
    EXPECT_EQ(r.input_path, dir / "ghost.png");
}

TEST_F(CompressionPipelineTest, CorruptImageIsDecodeErrorAndUntouched) {
    write_bytes(dir / "text.png", "definitely not an image\n");
    const auto r = run(dir / "text.png");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, ErrorKind::DecodeError);
    EXPECT_EQ(r.original_size, 24u);
    EXPECT_EQ(entries(), std::vector<std::string>{"text.png"});
}

TEST_F(CompressionPipelineTest, SuffixBackupLeavesOriginalAlone) {
    config.backup_original = true;
    const auto input = write_jpeg("photo.jpg", make_random(64, 64, 2));
    const auto before = fs::file_size(input);

    const auto r = run(input);
    ASSERT_TRUE(r.success) << r.error_message;
    EXPECT_EQ(r.output_path, dir / "photo_compressed.jpg");
    EXPECT_EQ(fs::file_size(input), before);
    EXPECT_EQ(entries(), (std::vector<std::string>{"photo.jpg", "photo_compressed.jpg"}));
}

TEST_F(CompressionPipelineTest, EmptySuffixBackupRenamesToBak) {
    config.backup_original = true;
    config.output_suffix = "";
    const auto input = write_jpeg("photo.jpg", make_random(64, 64, 3));
    const auto before = fs::file_size(input);

    const auto r = run(input);
    ASSERT_TRUE(r.success) << r.error_message;
    EXPECT_EQ(r.output_path, input);
    EXPECT_EQ(fs::file_size(dir / "photo.jpg.bak"), before);
    EXPECT_EQ(entries(), (std::vector<std::string>{"photo.jpg", "photo.jpg.bak"}));
}

TEST_F(CompressionPipelineTest, EncodeFailureAfterBakRenameLeavesOnlyBackup) {
    // PNG content under a .webp name: decodes fine, but WebP cannot hold 17000 px rows
    config.format = "WEBP";
    config.backup_original = true;
    config.output_suffix = "";
    const auto input = write_png(dir / "strip.webp", make_gradient(17000, 1));

    const auto r = run(input);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, ErrorKind::EncodeError);
    EXPECT_FALSE(fs::exists(input));
    EXPECT_TRUE(fs::exists(dir / "strip.webp.bak"));
    EXPECT_EQ(entries(), std::vector<std::string>{"strip.webp.bak"});
}

TEST_F(CompressionPipelineTest, StopRequestedBeforeWriteIsCancelled) {
    const auto input = write_png(dir / "c.png", make_gradient(10, 10));
    std::stop_source source;
    source.request_stop();

    const CompressionPipeline pipeline(config, registry);
    const auto r = pipeline.process(input, source.get_token());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, ErrorKind::Cancelled);
    EXPECT_EQ(entries(), std::vector<std::string>{"c.png"});
}

TEST_F(CompressionPipelineTest, UnsupportedTargetIsRejectedUpFront) {
    config.format = "GIF";
    try {
        const CompressionPipeline pipeline(config, registry);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedFormat);
    }
}

TEST_F(CompressionPipelineTest, RatioMatchesSizes) {
    const auto input = write_png(dir / "r.png", make_random(50, 50, 4));
    const auto r = run(input);
    ASSERT_TRUE(r.success) << r.error_message;
    const double expected = 1.0 - static_cast<double>(r.compressed_size) / static_cast<double>(r.original_size);
    EXPECT_DOUBLE_EQ(r.compression_ratio(), expected);
}
