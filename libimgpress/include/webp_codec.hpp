/**
 * @file webp_codec.hpp
 * @brief Defines the ICodec implementation for WEBP files.
 */

#ifndef IMGPRESS_WEBP_CODEC_HPP
#define IMGPRESS_WEBP_CODEC_HPP

#include "codec.hpp"
#include <array>
#include <span>
#include <string_view>

namespace imgpress {

    /**
     * @brief WebP codec built on libwebp.
     *
     * @details Decodes to RGB or RGBA. Encodes lossy with the requested
     * quality and method, always lossy.
     */
    class WebpCodec final : public ICodec {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "WEBP";
        }

        [[nodiscard]] ImageFormat get_format() const noexcept override {
            return ImageFormat::Webp;
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/webp" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".webp" };
            return {kExts.data(), kExts.size()};
        }

        [[nodiscard]] RasterImage decode(const std::filesystem::path& path) const override;

        std::uintmax_t encode(const RasterImage& image,
                              const std::filesystem::path& path,
                              const EncodeParams& params) const override;
    };

} // namespace imgpress

#endif // IMGPRESS_WEBP_CODEC_HPP
