/**
 * @file image_transformer.hpp
 * @brief Color normalization, resizing and encode-parameter derivation.
 */

#ifndef IMGPRESS_IMAGE_TRANSFORMER_HPP
#define IMGPRESS_IMAGE_TRANSFORMER_HPP

#include "config.hpp"
#include "encode_params.hpp"
#include "raster_image.hpp"
#include <cstdint>
#include <utility>

namespace imgpress {

struct TransformResult {
    RasterImage image;
    EncodeParams params;
};

/**
 * @brief Turns a decoded image into what the target encoder should receive.
 */
class ImageTransformer {
public:
    /**
     * @brief Normalize, resize and pick encode parameters.
     *
     * For JPEG targets, images with alpha or a palette are composited onto
     * white first. Resizing (Lanczos-3) happens only when max_width or
     * max_height is set and the computed size differs. The image is taken
     * by value and moved into the result when no step changes it.
     * @throws ConfigError(UnsupportedFormat) if the configured format is unknown.
     */
    [[nodiscard]] static TransformResult transform(RasterImage image,
                                                   const CompressionConfig& config);

    /**
     * @brief Target size for a @p width x @p height image.
     *
     * Width cap first (height scaled with truncation), then the height cap
     * on that intermediate size. Both results are at least 1.
     */
    [[nodiscard]] static std::pair<uint32_t, uint32_t>
    compute_target_dimensions(uint32_t width, uint32_t height, const CompressionConfig& config);

    /**
     * @brief Encoder settings for the configured target format.
     * @throws ConfigError(UnsupportedFormat) if the configured format is unknown.
     */
    [[nodiscard]] static EncodeParams derive_encode_params(const CompressionConfig& config);
};

} // namespace imgpress

#endif // IMGPRESS_IMAGE_TRANSFORMER_HPP
