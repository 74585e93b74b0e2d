/**
 * @file png_codec.hpp
 * @brief Defines the ICodec implementation for PNG files.
 */

#ifndef IMGPRESS_PNG_CODEC_HPP
#define IMGPRESS_PNG_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace imgpress {

    /**
     * @brief PNG codec built on libpng and zlib.
     *
     * @details Lossless both ways. Gray, GrayAlpha, RGB, RGBA and palette
     * (with tRNS) layouts are preserved; 16-bit samples are stripped to 8.
     */
    class PngCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PNG";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override {
            return ImageFormat::Png;
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/png" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".png" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] RasterImage decode(const std::filesystem::path& path) const override;

        std::uintmax_t encode(const RasterImage& image,
                              const std::filesystem::path& path,
                              const EncodeParams& params) const override;
    };

} // namespace imgpress

#endif // IMGPRESS_PNG_CODEC_HPP
