/**
 * @file codec_registry.hpp
 * @brief Defines the registry for discovering and managing ICodec instances.
 */

#ifndef IMGPRESS_CODEC_REGISTRY_HPP
#define IMGPRESS_CODEC_REGISTRY_HPP

#include "codec.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace imgpress {

/**
 * @brief Registry of all available codecs.
 *
 * @details The CodecRegistry owns and manages the lifetime of all concrete
 * ICodec implementations. It provides lookup facilities to find the codec
 * for a MIME type, a file extension or an ImageFormat.
 *
 * The registry is typically instantiated once per execution and passed to
 * CompressionPipeline and BatchExecutor. Lookups are read-only and safe to
 * run from several threads.
 */
class CodecRegistry {
public:
    /**
     * @brief Construct and register the built-in codecs
     * (JPEG, PNG, WebP, TIFF, BMP).
     */
    CodecRegistry();

    /**
     * @brief Find all codecs that support a given MIME type.
     * @param mime MIME type string (e.g. "image/png").
     * @return Non-owning pointers, empty if none matches.
     */
    [[nodiscard]] std::vector<ICodec*> find_by_mime(const std::string& mime) const;

    /**
     * @brief Find all codecs that support a given file extension.
     *
     * Comparison is case-insensitive.
     *
     * @param ext File extension (including the dot, e.g. ".png").
     * @return Non-owning pointers, empty if none matches.
     */
    [[nodiscard]] std::vector<ICodec*> find_by_extension(const std::string& ext) const;

    /**
     * @brief The codec writing @p format, or nullptr.
     */
    [[nodiscard]] ICodec* find_by_format(ImageFormat format) const;

    /**
     * @brief Pick the decoder for a file: by sniffed MIME type first, then by extension.
     * @return nullptr if neither identifies a registered codec.
     */
    [[nodiscard]] ICodec* resolve_decoder(const std::filesystem::path& path) const;

    /**
     * @brief Access all registered codecs.
     */
    [[nodiscard]] const std::vector<std::unique_ptr<ICodec>>& all() const { return codecs_; }

private:
    std::vector<std::unique_ptr<ICodec>> codecs_;
};

} // namespace imgpress

#endif // IMGPRESS_CODEC_REGISTRY_HPP
