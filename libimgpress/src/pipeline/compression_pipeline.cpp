#include "../../include/compression_pipeline.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/image_transformer.hpp"
#include "../../include/logger.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace imgpress {

namespace {

constexpr std::string_view kTag = "pipeline";

std::string describe_ratio(const CompressionResult& r) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << r.compression_ratio() * 100.0 << "%";
    return oss.str();
}

} // namespace

CompressionPipeline::CompressionPipeline(const CompressionConfig& config, const CodecRegistry& registry)
    : config_(config),
      registry_(registry),
      target_format_(config.target_format()),
      encoder_(registry.find_by_format(target_format_)) {
    if (!encoder_) {
        throw ConfigError(ErrorKind::UnsupportedFormat,
                          "No encoder registered for " + std::string(format_to_string(target_format_)));
    }
}

CompressionResult CompressionPipeline::process(const fs::path& input_path, std::stop_token stop) const noexcept {
    CompressionResult result;
    result.input_path = input_path;
    const auto start = std::chrono::steady_clock::now();

    try {
        run(input_path, stop, result);
    } catch (const std::exception& e) {
        result.success = false;
        result.error_kind = ErrorKind::Unknown;
        result.error_message = e.what();
        Logger::log(LogLevel::Error, "Unexpected error processing " + input_path.string() + ": " + e.what(), kTag);
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

void CompressionPipeline::run(const fs::path& input_path, const std::stop_token& stop,
                              CompressionResult& result) const {
    auto fail = [&](const Failure& f) {
        result.success = false;
        result.error_kind = f.kind;
        result.error_message = f.message;
        const LogLevel level = f.kind == ErrorKind::Cancelled ? LogLevel::Info : LogLevel::Error;
        Logger::log(level, "Error processing " + input_path.string() + ": " + f.message, kTag);
    };

    std::error_code ec;
    const bool exists = fs::exists(input_path, ec);
    if (ec) {
        return fail({ErrorKind::FilesystemError, "Cannot access file: " + ec.message()});
    }
    if (!exists) {
        return fail({ErrorKind::NotFound, "File not found"});
    }

    if (auto f = read_original_size(input_path, result.original_size)) {
        return fail(*f);
    }
    if (result.original_size == 0) {
        return fail({ErrorKind::DecodeError, "Empty file"});
    }

    RasterImage image;
    if (auto f = decode(input_path, image)) {
        return fail(*f);
    }

    TransformResult transformed = ImageTransformer::transform(std::move(image), config_);

    const ImageFormat original_format = format_from_path(input_path);
    const OutputPlan plan = PathPlanner::plan(input_path, original_format, target_format_, config_);
    result.output_path = plan.output_path;
    result.format_changed = plan.format_changed;

    if (stop.stop_requested()) {
        return fail({ErrorKind::Cancelled, "Stop requested before writing"});
    }

    if (auto f = backup_original(plan, input_path)) {
        return fail(*f);
    }

    if (auto f = encode(transformed.image, transformed.params, plan.output_path)) {
        return fail(*f);
    }

    if (auto f = delete_original(plan, input_path, result.original_deleted)) {
        return fail(*f);
    }

    const auto compressed = file_size_or_none(plan.output_path);
    if (!compressed) {
        return fail({ErrorKind::FilesystemError, "Cannot read size of " + plan.output_path.string()});
    }
    result.compressed_size = *compressed;
    result.success = true;

    Logger::log(LogLevel::Info,
                "Compressed " + input_path.filename().string() + " -> " + plan.output_path.filename().string() +
                (plan.format_changed
                     ? " [" + std::string(format_to_string(original_format)) + " -> " +
                       std::string(format_to_string(target_format_)) + "]"
                     : std::string()) +
                ": " + std::to_string(result.original_size) + " -> " + std::to_string(result.compressed_size) +
                " bytes (" + describe_ratio(result) + " reduction)",
                kTag);
}

std::optional<CompressionPipeline::Failure>
CompressionPipeline::read_original_size(const fs::path& input, std::uintmax_t& size) const {
    std::error_code ec;
    size = fs::file_size(input, ec);
    if (ec) {
        size = 0;
        return Failure{ErrorKind::FilesystemError, "Cannot read file size: " + ec.message()};
    }
    return std::nullopt;
}

std::optional<CompressionPipeline::Failure>
CompressionPipeline::decode(const fs::path& input, RasterImage& image) const {
    const ICodec* codec = registry_.resolve_decoder(input);
    if (!codec) {
        return Failure{ErrorKind::DecodeError, "Cannot identify image file"};
    }
    try {
        image = codec->decode(input);
    } catch (const CodecError& e) {
        return Failure{e.kind(), e.what()};
    }
    Logger::log(LogLevel::Debug,
                "Decoded " + input.filename().string() + " with " + std::string(codec->get_name()) + " (" +
                std::to_string(image.width) + "x" + std::to_string(image.height) + " " +
                std::string(color_mode_to_string(image.mode)) + ")",
                kTag);
    return std::nullopt;
}

std::optional<CompressionPipeline::Failure>
CompressionPipeline::backup_original(const OutputPlan& plan, const fs::path& input) const {
    if (!plan.should_backup_original()) {
        return std::nullopt;
    }
    std::error_code ec;
    fs::rename(input, plan.backup_path, ec);
    if (ec) {
        return Failure{ErrorKind::FilesystemError,
                       "Cannot rename original to " + plan.backup_path.string() + ": " + ec.message()};
    }
    Logger::log(LogLevel::Debug, "Backed up original to " + plan.backup_path.string(), kTag);
    return std::nullopt;
}

std::optional<CompressionPipeline::Failure>
CompressionPipeline::encode(const RasterImage& image, const EncodeParams& params, const fs::path& output) const {
    const fs::path temp = make_temp_sibling(output);
    std::error_code ec;

    try {
        encoder_->encode(image, temp, params);
    } catch (const CodecError& e) {
        fs::remove(temp, ec);
        return Failure{e.kind(), e.what()};
    } catch (const std::exception&) {
        fs::remove(temp, ec);
        throw;
    }

    fs::rename(temp, output, ec);
    if (ec) {
        const std::string rename_error = ec.message();
        std::error_code remove_ec;
        fs::remove(temp, remove_ec);
        return Failure{ErrorKind::FilesystemError, "Rename onto " + output.string() + " failed: " + rename_error};
    }
    return std::nullopt;
}

std::optional<CompressionPipeline::Failure>
CompressionPipeline::delete_original(const OutputPlan& plan, const fs::path& input, bool& deleted) const {
    deleted = false;
    if (!plan.should_delete_original || input == plan.output_path) {
        return std::nullopt;
    }
    std::error_code ec;
    if (!fs::exists(input, ec)) {
        return std::nullopt;
    }
    fs::remove(input, ec);
    if (ec) {
        return Failure{ErrorKind::FilesystemError, "Cannot delete original: " + ec.message()};
    }
    deleted = true;
    Logger::log(LogLevel::Debug, "Deleted original " + input.string(), kTag);
    return std::nullopt;
}

} // namespace imgpress
