#include "../../include/tiff_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <tiffio.h>
#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct TiffCloser {
    void operator()(TIFF* t) const { if (t) TIFFClose(t); }
};
using unique_TIFF = std::unique_ptr<TIFF, TiffCloser>;

std::string format_tiff_message(const char* module, const char* fmt, va_list ap) {
    char buffer[512];
    std::vsnprintf(buffer, sizeof(buffer), fmt, ap);
    return std::string(module ? module : "libtiff") + ": " + buffer;
}

void tiff_error_handler(const char* module, const char* fmt, va_list ap) {
    imgpress::Logger::log(imgpress::LogLevel::Debug, format_tiff_message(module, fmt, ap), "libtiff");
}

void tiff_warning_handler(const char* module, const char* fmt, va_list ap) {
    imgpress::Logger::log(imgpress::LogLevel::Debug, format_tiff_message(module, fmt, ap), "libtiff");
}

// libtiff prints to stderr by default; route it through Logger once
void install_tiff_handlers() {
    static const bool installed = [] {
        TIFFSetErrorHandler(tiff_error_handler);
        TIFFSetWarningHandler(tiff_warning_handler);
        return true;
    }();
    (void)installed;
}

} // namespace

namespace imgpress {

RasterImage TiffCodec::decode(const std::filesystem::path& path) const {
    install_tiff_handlers();

    const unique_TIFF in(TIFFOpen(path.string().c_str(), "r"));
    if (!in) {
        throw CodecError(ErrorKind::DecodeError, "Cannot open TIFF input: " + path.string());
    }

    uint32_t width = 0, height = 0;
    if (!TIFFGetField(in.get(), TIFFTAG_IMAGEWIDTH, &width) ||
        !TIFFGetField(in.get(), TIFFTAG_IMAGELENGTH, &height) ||
        width == 0 || height == 0) {
        throw CodecError(ErrorKind::DecodeError, "TIFF has no image dimensions: " + path.string());
    }

    std::vector<uint32_t> raster(static_cast<size_t>(width) * static_cast<size_t>(height));
    // read full image into raw rgba buffer, handles decompression
    if (!TIFFReadRGBAImageOriented(in.get(), width, height, raster.data(), ORIENTATION_TOPLEFT, 0)) {
        throw CodecError(ErrorKind::DecodeError, "TIFFReadRGBAImageOriented failed for " + path.string());
    }

    bool opaque = true;
    for (const uint32_t px : raster) {
        if (TIFFGetA(px) != 0xFF) {
            opaque = false;
            break;
        }
    }

    RasterImage image(width, height, opaque ? ColorMode::Rgb : ColorMode::Rgba);
    const unsigned ch = image.channels();
    for (size_t i = 0; i < raster.size(); ++i) {
        uint8_t* dst = &image.pixels[i * ch];
        dst[0] = static_cast<uint8_t>(TIFFGetR(raster[i]));
        dst[1] = static_cast<uint8_t>(TIFFGetG(raster[i]));
        dst[2] = static_cast<uint8_t>(TIFFGetB(raster[i]));
        if (!opaque) dst[3] = static_cast<uint8_t>(TIFFGetA(raster[i]));
    }

    if (TIFFNumberOfDirectories(in.get()) > 1) {
        Logger::log(LogLevel::Warning, "Multi-page TIFF, only the first page is kept: " + path.string(), get_name());
    }
    Logger::log(LogLevel::Debug,
                "Decoded TIFF " + std::to_string(width) + "x" + std::to_string(height), get_name());
    return image;
}

std::uintmax_t TiffCodec::encode(const RasterImage& image,
                                 const std::filesystem::path& path,
                                 const EncodeParams& params) const {
    install_tiff_handlers();

    const RasterImage src = expand_palette(image);
    const unsigned spp = src.channels();
    const bool gray = src.mode == ColorMode::Gray || src.mode == ColorMode::GrayAlpha;
    const bool alpha = src.mode == ColorMode::GrayAlpha || src.mode == ColorMode::Rgba;

    {
        const unique_TIFF out(TIFFOpen(path.string().c_str(), "w"));
        if (!out) {
            throw CodecError(ErrorKind::EncodeError, "Cannot open TIFF output: " + path.string());
        }
        TIFF* tif = out.get();

        TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, src.width);
        TIFFSetField(tif, TIFFTAG_IMAGELENGTH, src.height);
        TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, spp);
        TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, 8);
        TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, gray ? PHOTOMETRIC_MINISBLACK : PHOTOMETRIC_RGB);
        TIFFSetField(tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
        TIFFSetField(tif, TIFFTAG_ORIENTATION, ORIENTATION_TOPLEFT);
        if (alpha) {
            unsigned short extra_samples = EXTRASAMPLE_UNASSALPHA;
            TIFFSetField(tif, TIFFTAG_EXTRASAMPLES, 1, &extra_samples);
        }

        TIFFSetField(tif, TIFFTAG_COMPRESSION, COMPRESSION_ADOBE_DEFLATE);
        TIFFSetField(tif, TIFFTAG_PREDICTOR, PREDICTOR_HORIZONTAL);
        TIFFSetField(tif, TIFFTAG_ZIPQUALITY, params.optimize ? 9 : 6);
        TIFFSetField(tif, TIFFTAG_ROWSPERSTRIP, TIFFDefaultStripSize(tif, 0));

        const size_t stride = src.row_stride();
        std::vector<uint8_t> row(stride);
        for (uint32_t y = 0; y < src.height; ++y) {
            // libtiff may modify the buffer in place (predictor), so pass a copy
            std::copy_n(src.pixels.begin() + static_cast<std::ptrdiff_t>(y * stride), stride, row.begin());
            if (TIFFWriteScanline(tif, row.data(), y, 0) < 0) {
                throw CodecError(ErrorKind::EncodeError, "TIFF write scanline failed for " + path.string());
            }
        }
        if (!TIFFWriteDirectory(tif)) {
            throw CodecError(ErrorKind::EncodeError, "TIFF write directory failed for " + path.string());
        }
    }

    const auto size = file_size_or_none(path);
    if (!size) {
        throw CodecError(ErrorKind::EncodeError, "Cannot stat TIFF output: " + path.string());
    }
    Logger::log(LogLevel::Debug, "Encoded TIFF (deflate): " + path.string(), get_name());
    return *size;
}

} // namespace imgpress
