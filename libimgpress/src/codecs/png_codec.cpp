#include "../../include/png_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

    /**
     * @brief libpng error handler that throws a C++ exception.
     * @param msg The error message from libpng.
     */
    [[noreturn]] void png_error_fn(png_structp, const png_const_charp msg) {
        imgpress::Logger::log(imgpress::LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
        throw std::runtime_error(msg);
    }

    /**
     * @brief libpng warning handler.
     * @param msg The warning message from libpng.
     */
    void png_warning_fn(png_structp, const png_const_charp msg) {
        imgpress::Logger::log(imgpress::LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
    }

    /**
     * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
     * Ensures png_destroy_read_struct is called even if exceptions occur.
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;

        explicit PngRead() = default;

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }
    };

    /**
     * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
     * Ensures png_destroy_write_struct is called even if exceptions occur.
     */
    struct PngWrite {
        png_structp png = nullptr;
        png_infop info = nullptr;

        explicit PngWrite() = default;

        ~PngWrite() {
            if (png || info) png_destroy_write_struct(&png, &info);
        }
    };

    imgpress::ColorMode mode_from_color_type(const int color_type) {
        using imgpress::ColorMode;
        switch (color_type) {
            case PNG_COLOR_TYPE_GRAY:       return ColorMode::Gray;
            case PNG_COLOR_TYPE_GRAY_ALPHA: return ColorMode::GrayAlpha;
            case PNG_COLOR_TYPE_RGB:        return ColorMode::Rgb;
            case PNG_COLOR_TYPE_RGB_ALPHA:  return ColorMode::Rgba;
            case PNG_COLOR_TYPE_PALETTE:    return ColorMode::Palette;
            default:
                throw std::runtime_error("Unexpected PNG color type " + std::to_string(color_type));
        }
    }

    int color_type_from_mode(const imgpress::ColorMode mode) {
        using imgpress::ColorMode;
        switch (mode) {
            case ColorMode::Gray:      return PNG_COLOR_TYPE_GRAY;
            case ColorMode::GrayAlpha: return PNG_COLOR_TYPE_GRAY_ALPHA;
            case ColorMode::Rgb:       return PNG_COLOR_TYPE_RGB;
            case ColorMode::Rgba:      return PNG_COLOR_TYPE_RGB_ALPHA;
            case ColorMode::Palette:   return PNG_COLOR_TYPE_PALETTE;
        }
        return PNG_COLOR_TYPE_RGB;
    }

    // PLTE + tRNS -> RGBA palette entries
    std::vector<imgpress::RasterImage::PaletteEntry> read_palette(png_structp png, png_infop info) {
        png_colorp plte = nullptr;
        int num_palette = 0;
        if (!png_get_PLTE(png, info, &plte, &num_palette) || num_palette <= 0) {
            throw std::runtime_error("Palette PNG without PLTE chunk");
        }

        png_bytep trans = nullptr;
        int num_trans = 0;
        if (png_get_valid(png, info, PNG_INFO_tRNS)) {
            png_get_tRNS(png, info, &trans, &num_trans, nullptr);
        }

        std::vector<imgpress::RasterImage::PaletteEntry> palette(static_cast<size_t>(num_palette));
        for (int i = 0; i < num_palette; ++i) {
            const png_byte alpha = (trans && i < num_trans) ? trans[i] : 0xFF;
            palette[i] = {plte[i].red, plte[i].green, plte[i].blue, alpha};
        }
        return palette;
    }

} // namespace

namespace imgpress {

    RasterImage PngCodec::decode(const std::filesystem::path& path) const {
        const unique_FILE fp(open_file(path, "rb"));
        if (!fp) {
            throw CodecError(ErrorKind::DecodeError, "Cannot open PNG input: " + path.string());
        }

        try {
            png_byte sig[8];
            if (std::fread(sig, 1, sizeof(sig), fp.get()) != sizeof(sig) || png_sig_cmp(sig, 0, sizeof(sig)) != 0) {
                throw std::runtime_error("Not a PNG file");
            }

            PngRead rd;
            rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
            if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
            rd.info = png_create_info_struct(rd.png);
            if (!rd.info) throw std::runtime_error("png_create_info_struct failed");

            png_init_io(rd.png, fp.get());
            png_set_sig_bytes(rd.png, sizeof(sig));
            png_read_info(rd.png, rd.info);

            png_uint_32 width = 0, height = 0;
            int bit_depth = 0, color_type = 0;
            png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

            std::vector<RasterImage::PaletteEntry> palette;
            if (color_type == PNG_COLOR_TYPE_PALETTE) {
                palette = read_palette(rd.png, rd.info);
                if (bit_depth < 8) png_set_packing(rd.png);
            } else {
                if (bit_depth == 16) png_set_strip_16(rd.png);
                if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
                if (png_get_valid(rd.png, rd.info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(rd.png);
            }
            png_set_interlace_handling(rd.png);
            png_read_update_info(rd.png, rd.info);

            RasterImage image(width, height, mode_from_color_type(png_get_color_type(rd.png, rd.info)));
            image.palette = std::move(palette);

            const size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
            if (rowbytes != image.row_stride()) {
                throw std::runtime_error("Rowbytes mismatch after transforms");
            }

            std::vector<png_bytep> row_pointers(height);
            for (png_uint_32 y = 0; y < height; ++y) {
                row_pointers[y] = image.pixels.data() + y * rowbytes;
            }
            png_read_image(rd.png, row_pointers.data());
            png_read_end(rd.png, nullptr);

            Logger::log(LogLevel::Debug,
                        "Decoded PNG " + std::to_string(width) + "x" + std::to_string(height) + " " +
                        std::string(color_mode_to_string(image.mode)),
                        get_name());
            return image;
        } catch (const std::exception& e) {
            throw CodecError(ErrorKind::DecodeError, "PNG decode failed for " + path.string() + ": " + e.what());
        }
    }

    std::uintmax_t PngCodec::encode(const RasterImage& image,
                                    const std::filesystem::path& path,
                                    const EncodeParams& params) const {
        if (!image.is_valid()) {
            throw CodecError(ErrorKind::EncodeError, "Invalid image for PNG encode: " + path.string());
        }

        unique_FILE fp(open_file(path, "wb"));
        if (!fp) {
            throw CodecError(ErrorKind::EncodeError, "Cannot open PNG output: " + path.string());
        }

        try {
            PngWrite wr;
            wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
            if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
            wr.info = png_create_info_struct(wr.png);
            if (!wr.info) throw std::runtime_error("png_create_info_struct failed");

            png_init_io(wr.png, fp.get());

            if (params.optimize) {
                // set max compression
                png_set_compression_level(wr.png, Z_BEST_COMPRESSION);
                png_set_compression_mem_level(wr.png, 9);
                png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);
                png_set_filter(wr.png, PNG_FILTER_TYPE_BASE, PNG_ALL_FILTERS);
            } else {
                png_set_compression_level(wr.png, 6);
            }

            png_set_IHDR(wr.png, wr.info, image.width, image.height, 8, color_type_from_mode(image.mode),
                         PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);

            if (image.mode == ColorMode::Palette) {
                std::vector<png_color> plte;
                std::vector<png_byte> trans;
                plte.reserve(image.palette.size());
                for (const auto& entry : image.palette) {
                    plte.push_back({entry[0], entry[1], entry[2]});
                    trans.push_back(entry[3]);
                }
                png_set_PLTE(wr.png, wr.info, plte.data(), static_cast<int>(plte.size()));
                // only write tRNS if there is actual transparency
                if (image.has_alpha()) {
                    png_set_tRNS(wr.png, wr.info, trans.data(), static_cast<int>(trans.size()), nullptr);
                }
            }

            png_write_info(wr.png, wr.info);
            const size_t stride = image.row_stride();
            for (uint32_t y = 0; y < image.height; ++y) {
                // libpng takes non-const rows
                auto row = const_cast<png_bytep>(image.pixels.data() + y * stride);
                png_write_row(wr.png, row);
            }
            png_write_end(wr.png, wr.info);
        } catch (const std::exception& e) {
            throw CodecError(ErrorKind::EncodeError, "PNG encode failed for " + path.string() + ": " + e.what());
        }

        if (std::fflush(fp.get()) != 0) {
            throw CodecError(ErrorKind::EncodeError, "fflush failed for " + path.string());
        }
        fp.reset();

        const auto size = file_size_or_none(path);
        if (!size) {
            throw CodecError(ErrorKind::EncodeError, "Cannot stat PNG output: " + path.string());
        }
        Logger::log(LogLevel::Debug, "Encoded PNG: " + path.string(), get_name());
        return *size;
    }

} // namespace imgpress
