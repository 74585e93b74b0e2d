/**
 * @file bmp_codec.hpp
 * @brief Defines the ICodec implementation for BMP files.
 */

#ifndef IMGPRESS_BMP_CODEC_HPP
#define IMGPRESS_BMP_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace imgpress {

    /**
     * @brief BMP codec built on bmplib.
     *
     * @details Decodes 8-bit-per-channel RGB, RGBA and indexed bitmaps.
     * Encodes RGB or RGBA (palettes are expanded); RLE24 is allowed when
     * optimize is set.
     */
    class BmpCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "BMP";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override {
            return ImageFormat::Bmp;
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 3> kMimes = { "image/bmp", "image/x-bmp", "image/x-ms-bmp" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".bmp" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] RasterImage decode(const std::filesystem::path& path) const override;

        std::uintmax_t encode(const RasterImage& image,
                              const std::filesystem::path& path,
                              const EncodeParams& params) const override;
    };

} // namespace imgpress

#endif // IMGPRESS_BMP_CODEC_HPP
