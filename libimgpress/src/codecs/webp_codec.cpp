#include "../../include/webp_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <webp/decode.h>
#include <webp/encode.h>
#include <cstring>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr int kDefaultQuality = 75;
constexpr int kDefaultMethod = 4;

std::vector<uint8_t> read_whole_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("cannot open input file");
    }
    const std::streamsize size = file.tellg();
    if (size <= 0) {
        throw std::runtime_error("empty input file");
    }
    file.seekg(0, std::ios::beg);
    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        throw std::runtime_error("failed to read input file");
    }
    return data;
}

// owns a WebPPicture and the memory writer it encodes into
struct WebpEncodeState {
    WebPPicture picture{};
    WebPMemoryWriter writer{};

    WebpEncodeState() {
        WebPMemoryWriterInit(&writer);
    }

    ~WebpEncodeState() {
        WebPPictureFree(&picture);
        WebPMemoryWriterClear(&writer);
    }

    WebpEncodeState(const WebpEncodeState&) = delete;
    WebpEncodeState& operator=(const WebpEncodeState&) = delete;
};

} // namespace

namespace imgpress {

RasterImage WebpCodec::decode(const std::filesystem::path& path) const {
    try {
        const auto input_data = read_whole_file(path);

        // inspect bitstream features
        WebPBitstreamFeatures features;
        if (WebPGetFeatures(input_data.data(), input_data.size(), &features) != VP8_STATUS_OK) {
            throw std::runtime_error("feature detection failed");
        }
        if (features.has_animation) {
            throw std::runtime_error("animated WebP is not supported");
        }

        int width = 0, height = 0;
        const bool alpha = features.has_alpha != 0;
        const std::unique_ptr<uint8_t, decltype(&WebPFree)> decoded(
            alpha ? WebPDecodeRGBA(input_data.data(), input_data.size(), &width, &height)
                  : WebPDecodeRGB(input_data.data(), input_data.size(), &width, &height),
            &WebPFree);
        if (!decoded) {
            throw std::runtime_error("decode failed");
        }

        RasterImage image(static_cast<uint32_t>(width), static_cast<uint32_t>(height),
                          alpha ? ColorMode::Rgba : ColorMode::Rgb);
        std::memcpy(image.pixels.data(), decoded.get(), image.pixels.size());

        Logger::log(LogLevel::Debug,
                    "Decoded WebP " + std::to_string(width) + "x" + std::to_string(height) +
                    (features.format == 2 ? " lossless" : " lossy"),
                    get_name());
        return image;
    } catch (const std::exception& e) {
        throw CodecError(ErrorKind::DecodeError, "WebP decode failed for " + path.string() + ": " + e.what());
    }
}

std::uintmax_t WebpCodec::encode(const RasterImage& image,
                                 const std::filesystem::path& path,
                                 const EncodeParams& params) const {
    const RasterImage rgb = to_rgb_family(image);
    const int quality = params.quality.value_or(kDefaultQuality);

    WebPConfig config;
    if (!WebPConfigInit(&config)) {
        throw CodecError(ErrorKind::EncodeError, "WebPConfigInit failed");
    }
    config.quality = static_cast<float>(quality);
    config.method = params.method.value_or(kDefaultMethod);
    if (!WebPValidateConfig(&config)) {
        throw CodecError(ErrorKind::EncodeError, "Invalid WebP configuration");
    }

    WebpEncodeState state;
    if (!WebPPictureInit(&state.picture)) {
        throw CodecError(ErrorKind::EncodeError, "WebPPictureInit failed");
    }
    state.picture.width = static_cast<int>(rgb.width);
    state.picture.height = static_cast<int>(rgb.height);

    const int stride = static_cast<int>(rgb.row_stride());
    const int imported = rgb.mode == ColorMode::Rgba
        ? WebPPictureImportRGBA(&state.picture, rgb.pixels.data(), stride)
        : WebPPictureImportRGB(&state.picture, rgb.pixels.data(), stride);
    if (!imported) {
        throw CodecError(ErrorKind::EncodeError, "WebPPictureImport failed for " + path.string());
    }

    state.picture.writer = WebPMemoryWrite;
    state.picture.custom_ptr = &state.writer;
    if (!WebPEncode(&config, &state.picture)) {
        throw CodecError(ErrorKind::EncodeError,
                         "WebPEncode failed for " + path.string() +
                         " (error " + std::to_string(state.picture.error_code) + ")");
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw CodecError(ErrorKind::EncodeError, "Cannot open WebP output: " + path.string());
    }
    out.write(reinterpret_cast<const char*>(state.writer.mem), static_cast<std::streamsize>(state.writer.size));
    out.close();
    if (!out) {
        throw CodecError(ErrorKind::EncodeError, "Failed writing WebP output: " + path.string());
    }

    Logger::log(LogLevel::Debug,
                "Encoded WebP q=" + std::to_string(quality) + ": " + path.string(),
                get_name());
    return state.writer.size;
}

} // namespace imgpress
