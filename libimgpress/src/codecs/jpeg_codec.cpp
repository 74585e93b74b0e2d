#include "../../include/jpeg_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <jpeglib.h>
#include <string>

namespace {

constexpr int kDefaultQuality = 75;

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
[[noreturn]] void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    imgpress::Logger::log(imgpress::LogLevel::Debug, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

// libjpeg warnings (corrupt-but-readable data) are not fatal
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    imgpress::Logger::log(imgpress::LogLevel::Warning, std::string("libjpeg: ") + buffer, "libjpeg");
}

struct DecompressGuard {
    jpeg_decompress_struct& cinfo;
    ~DecompressGuard() { jpeg_destroy_decompress(&cinfo); }
};

struct CompressGuard {
    jpeg_compress_struct& cinfo;
    ~CompressGuard() { jpeg_destroy_compress(&cinfo); }
};

} // namespace

namespace imgpress {

RasterImage JpegCodec::decode(const std::filesystem::path& path) const {
    const unique_FILE infile(open_file(path, "rb"));
    if (!infile) {
        throw CodecError(ErrorKind::DecodeError, "Cannot open JPEG input: " + path.string());
    }

    jpeg_decompress_struct cinfo{};
    JpegErrorMgr jerr{};
    // error handlers must be set before any possible error
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_throw;
    jerr.pub.output_message = jpeg_output_message_log;

    try {
        jpeg_create_decompress(&cinfo);
        DecompressGuard guard{cinfo};

        jpeg_stdio_src(&cinfo, infile.get());
        if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
            throw std::runtime_error("Invalid JPEG header");
        }

        if (cinfo.jpeg_color_space == JCS_CMYK || cinfo.jpeg_color_space == JCS_YCCK) {
            throw std::runtime_error("CMYK JPEG is not supported");
        }
        const bool gray = cinfo.jpeg_color_space == JCS_GRAYSCALE;
        cinfo.out_color_space = gray ? JCS_GRAYSCALE : JCS_RGB;

        jpeg_start_decompress(&cinfo);

        RasterImage image(cinfo.output_width, cinfo.output_height,
                          gray ? ColorMode::Gray : ColorMode::Rgb);
        const size_t row_stride = image.row_stride();
        while (cinfo.output_scanline < cinfo.output_height) {
            JSAMPROW row = image.pixels.data() + cinfo.output_scanline * row_stride;
            jpeg_read_scanlines(&cinfo, &row, 1);
        }
        jpeg_finish_decompress(&cinfo);

        Logger::log(LogLevel::Debug,
                    "Decoded JPEG " + std::to_string(image.width) + "x" + std::to_string(image.height) +
                    (gray ? " gray" : " rgb"),
                    get_name());
        return image;
    } catch (const std::exception& e) {
        throw CodecError(ErrorKind::DecodeError, "JPEG decode failed for " + path.string() + ": " + e.what());
    }
}

std::uintmax_t JpegCodec::encode(const RasterImage& image,
                                 const std::filesystem::path& path,
                                 const EncodeParams& params) const {
    const RasterImage flat = flatten_onto_white(image);
    const bool gray = flat.mode == ColorMode::Gray;

    unique_FILE outfile(open_file(path, "wb"));
    if (!outfile) {
        throw CodecError(ErrorKind::EncodeError, "Cannot open JPEG output: " + path.string());
    }

    jpeg_compress_struct cinfo{};
    JpegErrorMgr jerr{};
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_throw;

    try {
        jpeg_create_compress(&cinfo);
        CompressGuard guard{cinfo};

        jpeg_stdio_dest(&cinfo, outfile.get());
        cinfo.image_width = flat.width;
        cinfo.image_height = flat.height;
        cinfo.input_components = gray ? 1 : 3;
        cinfo.in_color_space = gray ? JCS_GRAYSCALE : JCS_RGB;

        jpeg_set_defaults(&cinfo);
        jpeg_set_quality(&cinfo, params.quality.value_or(kDefaultQuality), TRUE);
        cinfo.optimize_coding = params.optimize ? TRUE : FALSE;
        if (params.progressive) {
            jpeg_simple_progression(&cinfo);
        }

        jpeg_start_compress(&cinfo, TRUE);
        const size_t row_stride = flat.row_stride();
        while (cinfo.next_scanline < cinfo.image_height) {
            // libjpeg takes non-const rows
            auto row = const_cast<JSAMPROW>(flat.pixels.data() + cinfo.next_scanline * row_stride);
            jpeg_write_scanlines(&cinfo, &row, 1);
        }
        jpeg_finish_compress(&cinfo);
    } catch (const std::exception& e) {
        throw CodecError(ErrorKind::EncodeError, "JPEG encode failed for " + path.string() + ": " + e.what());
    }

    // explicitly flush stdio buffer to disk before returning
    if (std::fflush(outfile.get()) != 0) {
        throw CodecError(ErrorKind::EncodeError, "fflush failed for " + path.string());
    }
    outfile.reset();

    const auto size = file_size_or_none(path);
    if (!size) {
        throw CodecError(ErrorKind::EncodeError, "Cannot stat JPEG output: " + path.string());
    }
    Logger::log(LogLevel::Debug,
                "Encoded JPEG q=" + std::to_string(params.quality.value_or(kDefaultQuality)) +
                (params.progressive ? " progressive" : " baseline") + ": " + path.string(),
                get_name());
    return *size;
}

} // namespace imgpress
