/**
 * @file tiff_codec.hpp
 * @brief Defines the ICodec implementation for TIFF files.
 */

#ifndef IMGPRESS_TIFF_CODEC_HPP
#define IMGPRESS_TIFF_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace imgpress {

    /**
     * @brief TIFF codec built on libtiff.
     *
     * @details Decodes the first directory through the RGBA reader (RGB when
     * fully opaque). Encodes Deflate with horizontal predictor.
     */
    class TiffCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "TIFF";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override {
            return ImageFormat::Tiff;
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/tiff" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 2> kExts = { ".tiff", ".tif" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] RasterImage decode(const std::filesystem::path& path) const override;

        std::uintmax_t encode(const RasterImage& image,
                              const std::filesystem::path& path,
                              const EncodeParams& params) const override;
    };

} // namespace imgpress

#endif // IMGPRESS_TIFF_CODEC_HPP
