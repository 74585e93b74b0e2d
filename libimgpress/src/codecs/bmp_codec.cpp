#include "../../include/bmp_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

extern "C" {
#include "bmplib.h"
}

namespace {
    // Helper to convert bmplib result codes to readable strings
    std::string bmplib_result_to_string(const BMPRESULT res) {
        switch (res) {
            case BMP_RESULT_OK:        return "OK";
            case BMP_RESULT_INVALID:   return "Invalid pixel data";
            case BMP_RESULT_TRUNCATED: return "File truncated";
            case BMP_RESULT_INSANE:    return "Image dimensions too large (sanity check failed)";
            case BMP_RESULT_PNG:       return "Embedded PNG (unsupported)";
            case BMP_RESULT_JPEG:      return "Embedded JPEG (unsupported)";
            case BMP_RESULT_ERROR:     return "Generic error";
            case BMP_RESULT_ARRAY:     return "OS/2 Bitmap Array (unsupported)";
            default:                   return "Unknown result code (" + std::to_string(res) + ")";
        }
    }

    // RAII wrapper for bmphandle to ensure free
    struct ScopedBmp {
        BMPHANDLE h = nullptr;
        FILE* f = nullptr;

        ScopedBmp(const std::filesystem::path& path, const char* mode) {
            f = imgpress::open_file(path, mode);
        }

        ~ScopedBmp() {
            if (h) bmp_free(h);
            if (f) fclose(f);
        }

        ScopedBmp(const ScopedBmp&) = delete;
        ScopedBmp& operator=(const ScopedBmp&) = delete;
    };

    struct MallocDeleter {
        void operator()(unsigned char* p) const { std::free(p); }
    };

    std::string describe(const BMPHANDLE h, const BMPRESULT res) {
        std::string err = h ? bmp_errmsg(h) : "";
        if (err.empty()) err = bmplib_result_to_string(res);
        return err;
    }
}

namespace imgpress {

RasterImage BmpCodec::decode(const std::filesystem::path& path) const {
    ScopedBmp in(path, "rb");
    if (!in.f) {
        throw CodecError(ErrorKind::DecodeError, "Cannot open BMP input: " + path.string());
    }

    in.h = bmpread_new(in.f);
    if (!in.h) {
        throw CodecError(ErrorKind::DecodeError, "bmplib: failed to create read handle");
    }

    BMPRESULT res = bmpread_load_info(in.h);
    if (res != BMP_RESULT_OK) {
        throw CodecError(ErrorKind::DecodeError, "BMP read error for " + path.string() + ": " + describe(in.h, res));
    }

    int width = 0, height = 0, channels = 0, bits = 0;
    bmpread_dimensions(in.h, &width, &height, &channels, &bits, nullptr);

    std::vector<RasterImage::PaletteEntry> palette;
    const int num_colors = bmpread_num_palette_colors(in.h);
    if (num_colors > 0) {
        unsigned char* raw_palette = nullptr;
        if (bmpread_load_palette(in.h, &raw_palette) != BMP_RESULT_OK) {
            throw CodecError(ErrorKind::DecodeError, "BMP palette load failed for " + path.string());
        }
        const std::unique_ptr<unsigned char, MallocDeleter> owned(raw_palette);
        // 4 bytes per entry: r, g, b, unused
        palette.resize(static_cast<size_t>(num_colors));
        for (int i = 0; i < num_colors; ++i) {
            palette[i] = {raw_palette[i * 4], raw_palette[i * 4 + 1], raw_palette[i * 4 + 2], 0xFF};
        }
        // with a palette loaded, bmplib returns 8-bit indices
        channels = 1;
        bits = 8;
    }

    if (bits != 8) {
        throw CodecError(ErrorKind::DecodeError,
                         "BMP with " + std::to_string(bits) + " bits per channel is not supported: " + path.string());
    }

    ColorMode mode;
    switch (channels) {
        case 1: mode = palette.empty() ? ColorMode::Gray : ColorMode::Palette; break;
        case 3: mode = ColorMode::Rgb; break;
        case 4: mode = ColorMode::Rgba; break;
        default:
            throw CodecError(ErrorKind::DecodeError,
                             "BMP with " + std::to_string(channels) + " channels is not supported: " + path.string());
    }

    RasterImage image(static_cast<uint32_t>(width), static_cast<uint32_t>(height), mode);
    image.palette = std::move(palette);
    if (bmpread_buffersize(in.h) != image.pixels.size()) {
        throw CodecError(ErrorKind::DecodeError, "BMP buffer size mismatch for " + path.string());
    }

    unsigned char* buffer = image.pixels.data();
    res = bmpread_load_image(in.h, &buffer);
    if (res != BMP_RESULT_OK) {
        throw CodecError(ErrorKind::DecodeError,
                         "BMP image data load failed for " + path.string() + ": " + describe(in.h, res));
    }

    Logger::log(LogLevel::Debug,
                "Decoded BMP " + std::to_string(width) + "x" + std::to_string(height) + " " +
                std::string(color_mode_to_string(mode)),
                get_name());
    return image;
}

std::uintmax_t BmpCodec::encode(const RasterImage& image,
                                const std::filesystem::path& path,
                                const EncodeParams& params) const {
    const RasterImage src = to_rgb_family(image);

    {
        ScopedBmp out(path, "wb");
        if (!out.f) {
            throw CodecError(ErrorKind::EncodeError, "Cannot open BMP output: " + path.string());
        }
        out.h = bmpwrite_new(out.f);
        if (!out.h) {
            throw CodecError(ErrorKind::EncodeError, "bmplib: failed to create write handle");
        }

        BMPRESULT res = bmpwrite_set_dimensions(out.h, static_cast<unsigned>(src.width),
                                                static_cast<unsigned>(src.height),
                                                static_cast<unsigned>(src.channels()), 8);
        if (res != BMP_RESULT_OK) {
            throw CodecError(ErrorKind::EncodeError, "BMP dimensions rejected: " + describe(out.h, res));
        }

        if (params.optimize && src.mode == ColorMode::Rgb) {
            // RLE24 is an OS/2 extension; AUTO falls back to uncompressed when it does not pay off
            bmpwrite_allow_rle24(out.h);
            bmpwrite_set_rle(out.h, BMP_RLE_AUTO);
            Logger::log(LogLevel::Debug, "Allowed RLE24 compression for RGB image", get_name());
        }

        res = bmpwrite_save_image(out.h, src.pixels.data());
        if (res != BMP_RESULT_OK) {
            throw CodecError(ErrorKind::EncodeError,
                             "BMP write failed for " + path.string() + ": " + describe(out.h, res));
        }
    }

    const auto size = file_size_or_none(path);
    if (!size) {
        throw CodecError(ErrorKind::EncodeError, "Cannot stat BMP output: " + path.string());
    }
    Logger::log(LogLevel::Debug, "Encoded BMP: " + path.string(), get_name());
    return *size;
}

} // namespace imgpress
