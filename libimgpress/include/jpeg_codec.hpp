/**
 * @file jpeg_codec.hpp
 * @brief Defines the ICodec implementation for JPEG files.
 */

#ifndef IMGPRESS_JPEG_CODEC_HPP
#define IMGPRESS_JPEG_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace imgpress {

    /**
     * @brief JPEG codec built on libjpeg.
     *
     * @details Decodes to Gray or RGB (CMYK input is rejected). Encodes Gray
     * or RGB; other layouts are converted first, alpha is dropped. Honors
     * quality, optimize (optimized Huffman tables) and progressive.
     */
    class JpegCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JPEG";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override {
            return ImageFormat::Jpeg;
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/jpeg", "image/pjpeg" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 3> kExts = { ".jpg", ".jpeg", ".jpe" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] RasterImage decode(const std::filesystem::path& path) const override;

        std::uintmax_t encode(const RasterImage& image,
                              const std::filesystem::path& path,
                              const EncodeParams& params) const override;
    };

} // namespace imgpress

#endif // IMGPRESS_JPEG_CODEC_HPP
