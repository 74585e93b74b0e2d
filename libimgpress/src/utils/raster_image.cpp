#include "../../include/raster_image.hpp"
#include <algorithm>

namespace imgpress {

namespace {

// (src * a + 255 * (255 - a)) / 255, rounded
inline uint8_t blend_on_white(const uint8_t value, const uint8_t alpha) {
    const unsigned v = value * alpha + 255u * (255u - alpha) + 127u;
    return static_cast<uint8_t>(v / 255u);
}

} // namespace

bool RasterImage::has_alpha() const noexcept {
    switch (mode) {
        case ColorMode::GrayAlpha:
        case ColorMode::Rgba:
            return true;
        case ColorMode::Palette:
            return std::ranges::any_of(palette, [](const PaletteEntry& e) { return e[3] != 0xFF; });
        default:
            return false;
    }
}

RasterImage expand_palette(const RasterImage& image) {
    if (image.mode != ColorMode::Palette) {
        return image;
    }
    const bool alpha = image.has_alpha();
    RasterImage out(image.width, image.height, alpha ? ColorMode::Rgba : ColorMode::Rgb);
    const unsigned ch = out.channels();
    const size_t count = static_cast<size_t>(image.width) * image.height;
    for (size_t i = 0; i < count; ++i) {
        const uint8_t index = image.pixels[i];
        // out-of-range indices render as opaque black
        static constexpr RasterImage::PaletteEntry black{0, 0, 0, 0xFF};
        const auto& entry = index < image.palette.size() ? image.palette[index] : black;
        std::copy_n(entry.begin(), ch, out.pixels.begin() + static_cast<std::ptrdiff_t>(i * ch));
    }
    return out;
}

RasterImage to_rgb_family(const RasterImage& image) {
    switch (image.mode) {
        case ColorMode::Rgb:
        case ColorMode::Rgba:
            return image;
        case ColorMode::Palette:
            return expand_palette(image);
        case ColorMode::Gray: {
            RasterImage out(image.width, image.height, ColorMode::Rgb);
            for (size_t i = 0, n = image.pixels.size(); i < n; ++i) {
                std::fill_n(out.pixels.begin() + static_cast<std::ptrdiff_t>(i * 3), 3, image.pixels[i]);
            }
            return out;
        }
        case ColorMode::GrayAlpha: {
            RasterImage out(image.width, image.height, ColorMode::Rgba);
            const size_t count = static_cast<size_t>(image.width) * image.height;
            for (size_t i = 0; i < count; ++i) {
                const uint8_t g = image.pixels[i * 2];
                out.pixels[i * 4 + 0] = g;
                out.pixels[i * 4 + 1] = g;
                out.pixels[i * 4 + 2] = g;
                out.pixels[i * 4 + 3] = image.pixels[i * 2 + 1];
            }
            return out;
        }
    }
    return image;
}

RasterImage flatten_onto_white(const RasterImage& image) {
    switch (image.mode) {
        case ColorMode::Gray:
        case ColorMode::Rgb:
            return image;

        case ColorMode::Palette: {
            if (!image.has_alpha()) {
                return expand_palette(image);
            }
            return flatten_onto_white(expand_palette(image));
        }

        case ColorMode::GrayAlpha: {
            RasterImage out(image.width, image.height, ColorMode::Gray);
            for (size_t i = 0, n = out.pixels.size(); i < n; ++i) {
                out.pixels[i] = blend_on_white(image.pixels[i * 2], image.pixels[i * 2 + 1]);
            }
            return out;
        }

        case ColorMode::Rgba: {
            RasterImage out(image.width, image.height, ColorMode::Rgb);
            const size_t count = static_cast<size_t>(image.width) * image.height;
            for (size_t i = 0; i < count; ++i) {
                const uint8_t* src = &image.pixels[i * 4];
                uint8_t* dst = &out.pixels[i * 3];
                dst[0] = blend_on_white(src[0], src[3]);
                dst[1] = blend_on_white(src[1], src[3]);
                dst[2] = blend_on_white(src[2], src[3]);
            }
            return out;
        }
    }
    return image;
}

} // namespace imgpress
