/**
 * @file resampler.cpp
 * @brief Separable Lanczos-3 resampler for 8-bit interleaved images.
 *
 * Horizontal pass into a float buffer, then vertical pass back to 8 bit.
 * When downscaling, the kernel is stretched by the scale factor so every
 * source pixel contributes.
 *
 * Images with alpha are filtered premultiplied, so the colour of
 * transparent pixels never bleeds into visible ones.
 */

#include "../../include/raster_image.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace imgpress {

namespace {

constexpr double kLanczosSupport = 3.0;

double sinc(const double x) {
    if (x == 0.0) return 1.0;
    const double px = std::numbers::pi * x;
    return std::sin(px) / px;
}

double lanczos3(const double x) {
    if (x <= -kLanczosSupport || x >= kLanczosSupport) return 0.0;
    return sinc(x) * sinc(x / kLanczosSupport);
}

/// Taps for one output sample: first source index and normalized weights.
struct Contribution {
    int first = 0;
    std::vector<float> weights;
};

std::vector<Contribution> compute_contributions(const uint32_t in_size, const uint32_t out_size) {
    const double scale = static_cast<double>(in_size) / out_size;
    const double filter_scale = std::max(scale, 1.0);
    const double support = kLanczosSupport * filter_scale;

    std::vector<Contribution> contribs(out_size);
    for (uint32_t i = 0; i < out_size; ++i) {
        const double center = (i + 0.5) * scale;
        const int left = std::max(0, static_cast<int>(std::floor(center - support)));
        const int right = std::min(static_cast<int>(in_size), static_cast<int>(std::ceil(center + support)));

        Contribution& c = contribs[i];
        c.first = left;
        double total = 0.0;
        for (int j = left; j < right; ++j) {
            const double w = lanczos3((j + 0.5 - center) / filter_scale);
            c.weights.push_back(static_cast<float>(w));
            total += w;
        }
        if (total != 0.0) {
            for (auto& w : c.weights) {
                w = static_cast<float>(w / total);
            }
        }
    }
    return contribs;
}

inline uint8_t clamp_to_byte(const float v) {
    return static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

} // namespace

RasterImage resize_lanczos(const RasterImage& image, const uint32_t new_width, const uint32_t new_height) {
    if (!image.is_valid()) {
        throw std::invalid_argument("resize_lanczos: invalid source image");
    }
    if (new_width == 0 || new_height == 0) {
        throw std::invalid_argument("resize_lanczos: target dimensions must be > 0");
    }

    const RasterImage src = image.mode == ColorMode::Palette ? expand_palette(image) : image;
    if (src.width == new_width && src.height == new_height) {
        return src;
    }

    const unsigned ch = src.channels();
    const bool alpha = src.has_alpha();
    const unsigned alpha_idx = ch - 1;
    const auto h_contribs = compute_contributions(src.width, new_width);
    const auto v_contribs = compute_contributions(src.height, new_height);

    // horizontal: src.height rows of new_width pixels, premultiplied when alpha
    std::vector<float> temp(static_cast<size_t>(new_width) * src.height * ch);
    for (uint32_t y = 0; y < src.height; ++y) {
        const uint8_t* row = src.pixels.data() + static_cast<size_t>(y) * src.row_stride();
        float* out_row = temp.data() + static_cast<size_t>(y) * new_width * ch;
        for (uint32_t x = 0; x < new_width; ++x) {
            const auto& c = h_contribs[x];
            for (unsigned k = 0; k < ch; ++k) {
                const bool premultiply = alpha && k != alpha_idx;
                float acc = 0.0f;
                for (size_t t = 0; t < c.weights.size(); ++t) {
                    const uint8_t* px = row + (c.first + t) * ch;
                    float v = px[k];
                    if (premultiply) v *= px[alpha_idx] / 255.0f;
                    acc += c.weights[t] * v;
                }
                out_row[x * ch + k] = acc;
            }
        }
    }

    // vertical
    RasterImage out(new_width, new_height, src.mode);
    const size_t temp_stride = static_cast<size_t>(new_width) * ch;
    std::vector<float> acc_row(temp_stride);
    for (uint32_t y = 0; y < new_height; ++y) {
        const auto& c = v_contribs[y];
        for (size_t i = 0; i < temp_stride; ++i) {
            float acc = 0.0f;
            for (size_t t = 0; t < c.weights.size(); ++t) {
                acc += c.weights[t] * temp[(c.first + t) * temp_stride + i];
            }
            acc_row[i] = acc;
        }

        uint8_t* out_row = out.pixels.data() + static_cast<size_t>(y) * out.row_stride();
        if (!alpha) {
            for (size_t i = 0; i < temp_stride; ++i) {
                out_row[i] = clamp_to_byte(acc_row[i]);
            }
            continue;
        }
        for (uint32_t x = 0; x < new_width; ++x) {
            const float* px = acc_row.data() + static_cast<size_t>(x) * ch;
            uint8_t* dst = out_row + static_cast<size_t>(x) * ch;
            const uint8_t a = clamp_to_byte(px[alpha_idx]);
            dst[alpha_idx] = a;
            for (unsigned k = 0; k < alpha_idx; ++k) {
                // fully transparent output has no meaningful colour
                dst[k] = a == 0 ? 0 : clamp_to_byte(px[k] * 255.0f / px[alpha_idx]);
            }
        }
    }
    return out;
}

} // namespace imgpress
