// shared fixtures for the imgpress tests

#ifndef IMGPRESS_TEST_HELPERS_HPP
#define IMGPRESS_TEST_HELPERS_HPP

#include "../libimgpress/include/encode_params.hpp"
#include "../libimgpress/include/png_codec.hpp"
#include "../libimgpress/include/raster_image.hpp"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace imgpress::test {

// ---------- helpers ----------

// fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        const auto base = std::filesystem::temp_directory_path();
        do {
            path_ = base / ("imgpress-test-" + std::to_string(rd()));
        } while (std::filesystem::exists(path_));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    [[nodiscard]] std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline RasterImage make_gradient(const uint32_t w, const uint32_t h, const ColorMode mode = ColorMode::Rgb) {
    RasterImage im(w, h, mode);
    const unsigned c = im.channels();
    for (uint32_t y = 0; y < h; ++y) {
        for (uint32_t x = 0; x < w; ++x) {
            uint8_t* px = &im.pixels[(static_cast<size_t>(y) * w + x) * c];
            px[0] = static_cast<uint8_t>(w > 1 ? x * 255 / (w - 1) : 0);
            if (c >= 3) {
                px[1] = static_cast<uint8_t>(h > 1 ? y * 255 / (h - 1) : 0);
                px[2] = static_cast<uint8_t>((x + y) & 0xFF);
            }
            if (c == 2 || c == 4) {
                px[c - 1] = static_cast<uint8_t>(255 - (x * 7 + y * 3) % 256);
            }
        }
    }
    return im;
}

inline RasterImage make_const(const uint32_t w, const uint32_t h,
                              const uint8_t r, const uint8_t g, const uint8_t b) {
    RasterImage im(w, h, ColorMode::Rgb);
    for (size_t i = 0; i < static_cast<size_t>(w) * h; ++i) {
        im.pixels[3 * i + 0] = r;
        im.pixels[3 * i + 1] = g;
        im.pixels[3 * i + 2] = b;
    }
    return im;
}

inline RasterImage make_random(const uint32_t w, const uint32_t h, const uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> d(0, 255);
    RasterImage im(w, h, ColorMode::Rgb);
    for (auto& v : im.pixels) v = static_cast<uint8_t>(d(rng));
    return im;
}

// writes a real PNG file with the library's own codec
inline std::filesystem::path write_png(const std::filesystem::path& path, const RasterImage& image) {
    EncodeParams params;
    params.format = ImageFormat::Png;
    params.optimize = true;
    PngCodec{}.encode(image, path, params);
    return path;
}

inline void write_bytes(const std::filesystem::path& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary);
    out << bytes;
}

} // namespace imgpress::test

#endif // IMGPRESS_TEST_HELPERS_HPP
