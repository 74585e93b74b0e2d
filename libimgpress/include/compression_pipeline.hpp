/**
 * @file compression_pipeline.hpp
 * @brief Decode, transform, plan, encode and clean up a single file.
 */

#ifndef IMGPRESS_COMPRESSION_PIPELINE_HPP
#define IMGPRESS_COMPRESSION_PIPELINE_HPP

#include "codec_registry.hpp"
#include "compression_result.hpp"
#include "config.hpp"
#include "path_planner.hpp"
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

namespace imgpress {

/**
 * @brief Runs the per-file compression steps.
 *
 * @details Steps, in order: existence check, size read, decode (codec picked
 * by libmagic MIME type, then extension), transform, output planning,
 * cancellation check, optional ".bak" rename, encode into a temporary
 * sibling file renamed onto the output path, deletion of the original when
 * the format changed, and the final size read.
 *
 * One instance is shared by all workers; process() keeps no state between
 * calls.
 */
class CompressionPipeline {
public:
    /**
     * @param config Validated configuration; must outlive the pipeline.
     * @param registry Codec registry; must outlive the pipeline.
     * @throws ConfigError(UnsupportedFormat) if no codec writes the target format.
     */
    CompressionPipeline(const CompressionConfig& config, const CodecRegistry& registry);

    /**
     * @brief Compress one file. Never throws.
     * @param input_path File to compress.
     * @param stop Checked once before anything is written; if a stop was
     * requested the result is ErrorKind::Cancelled and nothing changes on disk.
     */
    [[nodiscard]] CompressionResult process(const std::filesystem::path& input_path,
                                            std::stop_token stop = {}) const noexcept;

private:
    /// A step failure: classification plus message.
    struct Failure {
        ErrorKind kind;
        std::string message;
    };

    std::optional<Failure> read_original_size(const std::filesystem::path& input,
                                              std::uintmax_t& size) const;
    std::optional<Failure> decode(const std::filesystem::path& input, RasterImage& image) const;
    std::optional<Failure> backup_original(const OutputPlan& plan, const std::filesystem::path& input) const;
    std::optional<Failure> encode(const RasterImage& image, const EncodeParams& params,
                                  const std::filesystem::path& output) const;
    std::optional<Failure> delete_original(const OutputPlan& plan, const std::filesystem::path& input,
                                           bool& deleted) const;

    void run(const std::filesystem::path& input_path, const std::stop_token& stop,
             CompressionResult& result) const;

    const CompressionConfig& config_;
    const CodecRegistry& registry_;
    ImageFormat target_format_;
    ICodec* encoder_;
};

} // namespace imgpress

#endif // IMGPRESS_COMPRESSION_PIPELINE_HPP
