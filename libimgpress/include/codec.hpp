/**
 * @file codec.hpp
 * @brief Abstract decode/encode interface implemented once per image format.
 */

#ifndef IMGPRESS_CODEC_HPP
#define IMGPRESS_CODEC_HPP

#include "encode_params.hpp"
#include "image_format.hpp"
#include "raster_image.hpp"
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>

/**
 * @namespace imgpress
 * @brief The main namespace for the imgpress library.
 *
 * @details Holds the compression decision engine (PathPlanner,
 * ImageTransformer, CompressionPipeline, StatsAggregator), the ICodec
 * implementations, the directory walker, the batch executor and the
 * logging facade.
 */
namespace imgpress {

/**
 * @brief Interface for an image codec.
 *
 * Each implementation handles exactly one ImageFormat. It must be
 * self-descriptive about the MIME types and extensions it accepts so that
 * CodecRegistry can route files to it.
 *
 * Implementations are stateless: the same instance is used concurrently
 * by every worker thread.
 */
class ICodec {
public:
    virtual ~ICodec() = default;

    // --- self-description ---

    /// @return Human-readable name of the codec (e.g. "PNG"), also used as log tag.
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return The format this codec reads and writes.
    [[nodiscard]] virtual ImageFormat get_format() const noexcept = 0;

    /// @return List of supported MIME types (e.g. "image/png").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_mime_types() const noexcept = 0;

    /// @return List of supported file extensions (e.g. ".png").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_extensions() const noexcept = 0;

    // --- operations ---

    /**
     * @brief Decode a file into 8-bit samples.
     * @param path File to read.
     * @return The decoded image, always is_valid().
     * @throws CodecError (DecodeError) if the file is unreadable or corrupt.
     */
    [[nodiscard]] virtual RasterImage decode(const std::filesystem::path& path) const = 0;

    /**
     * @brief Encode @p image to @p path, replacing any existing file.
     * @param image Pixels to write. Codecs convert layouts they cannot store.
     * @param path Destination file.
     * @param params Encoder settings; fields not relevant to this format are ignored.
     * @return Number of bytes written.
     * @throws CodecError (EncodeError) on failure. A partial file may remain at @p path.
     */
    virtual std::uintmax_t encode(const RasterImage& image,
                                  const std::filesystem::path& path,
                                  const EncodeParams& params) const = 0;
};

} // namespace imgpress

#endif // IMGPRESS_CODEC_HPP
