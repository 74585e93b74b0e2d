#include "../../include/image_transformer.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <utility>

namespace imgpress {

namespace {

constexpr int kWebpMethod = 6;

uint32_t scale_dimension(const uint32_t value, const uint32_t numerator, const uint32_t denominator) {
    // truncating, like int(value * num / den)
    const uint64_t scaled = static_cast<uint64_t>(value) * numerator / denominator;
    return static_cast<uint32_t>(std::max<uint64_t>(scaled, 1));
}

} // namespace

std::pair<uint32_t, uint32_t>
ImageTransformer::compute_target_dimensions(uint32_t width, uint32_t height,
                                            const CompressionConfig& config) {
    if (config.max_width && width > static_cast<uint32_t>(*config.max_width)) {
        const auto max_w = static_cast<uint32_t>(*config.max_width);
        height = scale_dimension(height, max_w, width);
        width = max_w;
    }
    if (config.max_height && height > static_cast<uint32_t>(*config.max_height)) {
        const auto max_h = static_cast<uint32_t>(*config.max_height);
        width = scale_dimension(width, max_h, height);
        height = max_h;
    }
    return {std::max(width, 1u), std::max(height, 1u)};
}

EncodeParams ImageTransformer::derive_encode_params(const CompressionConfig& config) {
    EncodeParams params;
    params.format = config.target_format();
    switch (params.format) {
        case ImageFormat::Jpeg:
            params.quality = config.quality;
            params.progressive = config.progressive;
            params.optimize = config.optimize;
            break;
        case ImageFormat::Png:
            params.optimize = true;
            break;
        case ImageFormat::Webp:
            params.quality = config.quality;
            params.method = kWebpMethod;
            break;
        case ImageFormat::Tiff:
        case ImageFormat::Bmp:
            params.optimize = config.optimize;
            break;
        case ImageFormat::Unknown:
            throw ConfigError(ErrorKind::UnsupportedFormat, "Unsupported target format: " + config.format);
    }
    return params;
}

TransformResult ImageTransformer::transform(RasterImage image, const CompressionConfig& config) {
    TransformResult result{{}, derive_encode_params(config)};

    if (result.params.format == ImageFormat::Jpeg &&
        (image.has_alpha() || image.mode == ColorMode::Palette)) {
        Logger::log(LogLevel::Debug,
                    std::string("Flattening ") + std::string(color_mode_to_string(image.mode)) + " onto white",
                    "transformer");
        result.image = flatten_onto_white(image);
    } else {
        result.image = std::move(image);
    }

    if (config.max_width || config.max_height) {
        const auto [w, h] = compute_target_dimensions(result.image.width, result.image.height, config);
        if (w != result.image.width || h != result.image.height) {
            Logger::log(LogLevel::Debug,
                        "Resizing " + std::to_string(result.image.width) + "x" +
                        std::to_string(result.image.height) + " -> " +
                        std::to_string(w) + "x" + std::to_string(h),
                        "transformer");
            result.image = resize_lanczos(result.image, w, h);
        }
    }
    return result;
}

} // namespace imgpress
