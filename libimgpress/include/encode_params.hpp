/**
 * @file encode_params.hpp
 * @brief Format-specific encoder settings.
 */

#ifndef IMGPRESS_ENCODE_PARAMS_HPP
#define IMGPRESS_ENCODE_PARAMS_HPP

#include "image_format.hpp"
#include <optional>

namespace imgpress {

/**
 * @brief Knobs handed to ICodec::encode.
 *
 * Only the fields meaningful for @c format are set: quality for JPEG and
 * WebP, progressive for JPEG, method (0..6 effort) for WebP.
 */
struct EncodeParams {
    ImageFormat format = ImageFormat::Unknown;
    std::optional<int> quality;
    bool progressive = false;
    bool optimize = false;
    std::optional<int> method;

    bool operator==(const EncodeParams&) const = default;
};

} // namespace imgpress

#endif // IMGPRESS_ENCODE_PARAMS_HPP
