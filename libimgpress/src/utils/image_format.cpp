#include "../../include/image_format.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace imgpress {

namespace {

const std::unordered_map<std::string, ImageFormat> name_to_format = {
    { "jpeg", ImageFormat::Jpeg },
    { "jpg",  ImageFormat::Jpeg },
    { "png",  ImageFormat::Png },
    { "webp", ImageFormat::Webp },
    { "tiff", ImageFormat::Tiff },
    { "tif",  ImageFormat::Tiff },
    { "bmp",  ImageFormat::Bmp },
};

const std::unordered_map<std::string, ImageFormat> ext_to_format = {
    { ".jpg",  ImageFormat::Jpeg },
    { ".jpeg", ImageFormat::Jpeg },
    { ".jpe",  ImageFormat::Jpeg },
    { ".png",  ImageFormat::Png },
    { ".webp", ImageFormat::Webp },
    { ".tiff", ImageFormat::Tiff },
    { ".tif",  ImageFormat::Tiff },
    { ".bmp",  ImageFormat::Bmp },
};

} // namespace

std::string to_lower_ascii(const std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<ImageFormat> parse_image_format(const std::string_view name) {
    const auto it = name_to_format.find(to_lower_ascii(name));
    if (it == name_to_format.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string_view format_to_string(const ImageFormat format) noexcept {
    switch (format) {
        case ImageFormat::Jpeg:    return "JPEG";
        case ImageFormat::Png:     return "PNG";
        case ImageFormat::Webp:    return "WEBP";
        case ImageFormat::Tiff:    return "TIFF";
        case ImageFormat::Bmp:     return "BMP";
        case ImageFormat::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string_view canonical_extension(const ImageFormat format) noexcept {
    switch (format) {
        case ImageFormat::Jpeg:    return ".jpg";
        case ImageFormat::Png:     return ".png";
        case ImageFormat::Webp:    return ".webp";
        case ImageFormat::Tiff:    return ".tiff";
        case ImageFormat::Bmp:     return ".bmp";
        case ImageFormat::Unknown: return "";
    }
    return "";
}

ImageFormat format_from_extension(const std::string_view ext) {
    const auto it = ext_to_format.find(to_lower_ascii(ext));
    return it != ext_to_format.end() ? it->second : ImageFormat::Unknown;
}

} // namespace imgpress
