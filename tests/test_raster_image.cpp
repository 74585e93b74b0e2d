#include "../libimgpress/include/raster_image.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

using namespace imgpress;
using namespace imgpress::test;

namespace {

RasterImage make_palette_image(const bool with_transparency) {
    RasterImage im(4, 2, ColorMode::Palette);
    im.palette = {
        {255, 0, 0, 255},
        {0, 0, 255, static_cast<uint8_t>(with_transparency ? 0 : 255)},
    };
    for (size_t i = 0; i < im.pixels.size(); ++i) im.pixels[i] = static_cast<uint8_t>(i % 2);
    return im;
}

} // namespace

// ---------- alpha / palette ----------

TEST(RasterImage, HasAlphaFollowsMode) {
    EXPECT_FALSE(RasterImage(2, 2, ColorMode::Rgb).has_alpha());
    EXPECT_FALSE(RasterImage(2, 2, ColorMode::Gray).has_alpha());
    EXPECT_TRUE(RasterImage(2, 2, ColorMode::Rgba).has_alpha());
    EXPECT_TRUE(RasterImage(2, 2, ColorMode::GrayAlpha).has_alpha());
    EXPECT_FALSE(make_palette_image(false).has_alpha());
    EXPECT_TRUE(make_palette_image(true).has_alpha());
}

TEST(RasterImage, ExpandPaletteResolvesIndices) {
    const auto opaque = expand_palette(make_palette_image(false));
    ASSERT_EQ(opaque.mode, ColorMode::Rgb);
    EXPECT_EQ(opaque.pixels[0], 255);
    EXPECT_EQ(opaque.pixels[3 + 2], 255); // second pixel is blue

    const auto transparent = expand_palette(make_palette_image(true));
    ASSERT_EQ(transparent.mode, ColorMode::Rgba);
    EXPECT_EQ(transparent.pixels[3], 255);
    EXPECT_EQ(transparent.pixels[4 + 3], 0);
}

TEST(RasterImage, ExpandPaletteOutOfRangeIndexIsBlack) {
    auto im = make_palette_image(false);
    im.pixels[0] = 200;
    const auto out = expand_palette(im);
    EXPECT_EQ(out.pixels[0], 0);
    EXPECT_EQ(out.pixels[1], 0);
    EXPECT_EQ(out.pixels[2], 0);
}

// ---------- flattening ----------

TEST(RasterImage, FlattenTransparentRgbaGivesWhite) {
    RasterImage im(3, 3, ColorMode::Rgba); // all zero: fully transparent black
    const auto out = flatten_onto_white(im);
    ASSERT_EQ(out.mode, ColorMode::Rgb);
    for (const auto v : out.pixels) EXPECT_EQ(v, 255);
}

TEST(RasterImage, FlattenOpaqueRgbaKeepsColor) {
    RasterImage im(1, 1, ColorMode::Rgba);
    im.pixels = {10, 20, 30, 255};
    const auto out = flatten_onto_white(im);
    EXPECT_EQ(out.pixels, (std::vector<uint8_t>{10, 20, 30}));
}

TEST(RasterImage, FlattenHalfAlphaBlends) {
    RasterImage im(1, 1, ColorMode::GrayAlpha);
    im.pixels = {0, 128};
    const auto out = flatten_onto_white(im);
    ASSERT_EQ(out.mode, ColorMode::Gray);
    EXPECT_NEAR(out.pixels[0], 127, 1);
}

TEST(RasterImage, FlattenPaletteUsesItsAlpha) {
    const auto out = flatten_onto_white(make_palette_image(true));
    ASSERT_EQ(out.mode, ColorMode::Rgb);
    EXPECT_EQ(out.pixels[0], 255); // red, opaque
    EXPECT_EQ(out.pixels[1], 0);
    EXPECT_EQ(out.pixels[3], 255); // blue, transparent -> white
    EXPECT_EQ(out.pixels[4], 255);
    EXPECT_EQ(out.pixels[5], 255);
}

TEST(RasterImage, GrayToRgbFamilyReplicatesChannel) {
    RasterImage im(2, 1, ColorMode::Gray);
    im.pixels = {7, 200};
    const auto out = to_rgb_family(im);
    ASSERT_EQ(out.mode, ColorMode::Rgb);
    EXPECT_EQ(out.pixels, (std::vector<uint8_t>{7, 7, 7, 200, 200, 200}));
}

// ---------- resampling ----------

TEST(Resampler, ConstantImageStaysConstant) {
    const auto src = make_const(64, 48, 90, 160, 220);
    const auto out = resize_lanczos(src, 17, 13);
    ASSERT_EQ(out.width, 17u);
    ASSERT_EQ(out.height, 13u);
    ASSERT_TRUE(out.is_valid());
    for (size_t i = 0; i < out.pixels.size(); i += 3) {
        EXPECT_NEAR(out.pixels[i + 0], 90, 1);
        EXPECT_NEAR(out.pixels[i + 1], 160, 1);
        EXPECT_NEAR(out.pixels[i + 2], 220, 1);
    }
}

TEST(Resampler, UpscaleAndKeepsMode) {
    const auto src = make_gradient(8, 8, ColorMode::Rgba);
    const auto out = resize_lanczos(src, 20, 11);
    EXPECT_EQ(out.mode, ColorMode::Rgba);
    EXPECT_EQ(out.pixels.size(), 20u * 11u * 4u);
}

TEST(Resampler, SameSizeIsIdentity) {
    const auto src = make_random(9, 5, 42);
    const auto out = resize_lanczos(src, 9, 5);
    EXPECT_EQ(out.pixels, src.pixels);
}

TEST(Resampler, RejectsZeroTarget) {
    const auto src = make_const(4, 4, 0, 0, 0);
    EXPECT_THROW((void)resize_lanczos(src, 0, 4), std::invalid_argument);
}

TEST(Resampler, TransparentColorDoesNotBleedIntoOpaqueEdge) {
    // left half invisible red, right half opaque blue
    RasterImage src(8, 1, ColorMode::Rgba);
    for (uint32_t x = 0; x < 8; ++x) {
        uint8_t* px = src.pixels.data() + x * 4;
        if (x < 4) {
            px[0] = 255; px[1] = 0; px[2] = 0; px[3] = 0;
        } else {
            px[0] = 0; px[1] = 0; px[2] = 255; px[3] = 255;
        }
    }

    const auto out = resize_lanczos(src, 2, 1);
    ASSERT_EQ(out.mode, ColorMode::Rgba);
    for (uint32_t x = 0; x < 2; ++x) {
        const uint8_t* px = out.pixels.data() + x * 4;
        EXPECT_EQ(px[0], 0) << "pixel " << x;
        if (px[3] > 0) {
            EXPECT_GE(px[2], 250) << "pixel " << x;
        }
    }
    EXPECT_GE(out.pixels[7], 200);
}

TEST(Resampler, GrayAlphaIsFilteredPremultiplied) {
    RasterImage src(8, 1, ColorMode::GrayAlpha);
    for (uint32_t x = 0; x < 8; ++x) {
        src.pixels[x * 2] = x < 4 ? 255 : 0;
        src.pixels[x * 2 + 1] = x < 4 ? 0 : 255;
    }

    const auto out = resize_lanczos(src, 2, 1);
    EXPECT_EQ(out.pixels[2], 0);
    EXPECT_GE(out.pixels[3], 200);
}
