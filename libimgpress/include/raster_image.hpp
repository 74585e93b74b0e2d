/**
 * @file raster_image.hpp
 * @brief Decoded pixel buffer passed between codecs and the transformer.
 */

#ifndef IMGPRESS_RASTER_IMAGE_HPP
#define IMGPRESS_RASTER_IMAGE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace imgpress {

/**
 * @brief Layout of RasterImage::pixels.
 */
enum class ColorMode {
    Gray,      ///< 1 byte per pixel
    GrayAlpha, ///< 2 bytes per pixel, alpha last
    Rgb,       ///< 3 bytes per pixel
    Rgba,      ///< 4 bytes per pixel, alpha last
    Palette    ///< 1 byte per pixel, index into RasterImage::palette
};

[[nodiscard]] constexpr std::string_view color_mode_to_string(const ColorMode mode) noexcept {
    switch (mode) {
        case ColorMode::Gray:      return "L";
        case ColorMode::GrayAlpha: return "LA";
        case ColorMode::Rgb:       return "RGB";
        case ColorMode::Rgba:      return "RGBA";
        case ColorMode::Palette:   return "P";
    }
    return "?";
}

/**
 * @brief An 8-bit-per-sample image, rows top to bottom, no padding.
 *
 * A RasterImage belongs to the pipeline invocation that decoded it and is
 * dropped right after encoding.
 */
struct RasterImage {
    using PaletteEntry = std::array<uint8_t, 4>; ///< r, g, b, a

    uint32_t width = 0;
    uint32_t height = 0;
    ColorMode mode = ColorMode::Rgb;
    std::vector<uint8_t> pixels;
    std::vector<PaletteEntry> palette; ///< only used in Palette mode

    RasterImage() = default;

    RasterImage(const uint32_t w, const uint32_t h, const ColorMode m)
        : width(w), height(h), mode(m),
          pixels(static_cast<size_t>(w) * h * channels_for(m), 0) {}

    [[nodiscard]] static constexpr unsigned channels_for(const ColorMode m) noexcept {
        switch (m) {
            case ColorMode::Gray:      return 1;
            case ColorMode::GrayAlpha: return 2;
            case ColorMode::Rgb:       return 3;
            case ColorMode::Rgba:      return 4;
            case ColorMode::Palette:   return 1;
        }
        return 1;
    }

    [[nodiscard]] unsigned channels() const noexcept { return channels_for(mode); }

    [[nodiscard]] size_t row_stride() const noexcept {
        return static_cast<size_t>(width) * channels();
    }

    /// True for GrayAlpha/Rgba, and for palettes with at least one non-opaque entry.
    [[nodiscard]] bool has_alpha() const noexcept;

    [[nodiscard]] bool is_valid() const noexcept {
        return width > 0 && height > 0 &&
               pixels.size() == row_stride() * height &&
               (mode != ColorMode::Palette || !palette.empty());
    }
};

/**
 * @brief Convert a Palette image to Rgb, or Rgba when the palette carries
 * transparency. Other modes are returned unchanged.
 */
[[nodiscard]] RasterImage expand_palette(const RasterImage& image);

/**
 * @brief Convert to Rgb or Rgba (keeping alpha when present).
 *
 * Used by encoders that do not support gray or indexed layouts.
 */
[[nodiscard]] RasterImage to_rgb_family(const RasterImage& image);

/**
 * @brief Composite onto an opaque white background of the same size.
 *
 * Rgba and alpha-carrying palettes become Rgb, GrayAlpha becomes Gray; the
 * alpha channel is the blend mask. Palettes without transparency are just
 * flattened to Rgb. Gray and Rgb inputs are returned unchanged.
 */
[[nodiscard]] RasterImage flatten_onto_white(const RasterImage& image);

/**
 * @brief Lanczos-3 resample to new_width x new_height.
 *
 * Palette images are expanded first. Both dimensions must be > 0.
 * @throws std::invalid_argument for an invalid image or zero target size.
 */
[[nodiscard]] RasterImage resize_lanczos(const RasterImage& image,
                                         uint32_t new_width,
                                         uint32_t new_height);

} // namespace imgpress

#endif // IMGPRESS_RASTER_IMAGE_HPP
