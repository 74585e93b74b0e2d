/**
 * @file image_format.hpp
 * @brief Image format enumeration and its mapping to names, extensions and MIME types.
 */

#ifndef IMGPRESS_IMAGE_FORMAT_HPP
#define IMGPRESS_IMAGE_FORMAT_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace imgpress {

/**
 * @brief Formats imgpress can decode from and encode to.
 */
enum class ImageFormat {
    Jpeg,
    Png,
    Webp,
    Tiff,
    Bmp,
    Unknown
};

/**
 * @brief Parse a configuration format name ("JPEG", "jpg", "WebP"...).
 * @return The format, or std::nullopt if the name is not recognized.
 */
[[nodiscard]] std::optional<ImageFormat> parse_image_format(std::string_view name);

/**
 * @brief Upper-case display name ("JPEG", "PNG"...).
 */
[[nodiscard]] std::string_view format_to_string(ImageFormat format) noexcept;

/**
 * @brief Extension written for a newly converted file (".jpg", ".png"...).
 */
[[nodiscard]] std::string_view canonical_extension(ImageFormat format) noexcept;

/**
 * @brief Map an extension (with the dot, any case) to a format.
 *
 * Aliases collapse: ".jpg", ".jpeg", ".jpe" are all Jpeg, ".tif" and ".tiff"
 * are both Tiff.
 */
[[nodiscard]] ImageFormat format_from_extension(std::string_view ext);

/**
 * @brief Format of a file, judged by its extension only.
 */
[[nodiscard]] inline ImageFormat format_from_path(const std::filesystem::path& path) {
    return format_from_extension(path.extension().string());
}

/**
 * @brief Lower-case copy of an ASCII string.
 */
[[nodiscard]] std::string to_lower_ascii(std::string_view s);

} // namespace imgpress

#endif // IMGPRESS_IMAGE_FORMAT_HPP
