/**
 * @file config.hpp
 * @brief Run-wide compression options and their YAML/JSON file format.
 */

#ifndef IMGPRESS_CONFIG_HPP
#define IMGPRESS_CONFIG_HPP

#include "image_format.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace imgpress {

/**
 * @brief Compression configuration.
 *
 * Loaded once at startup (file, then command-line overrides), validated,
 * and then shared read-only by every worker for the rest of the run.
 */
struct CompressionConfig {
    int quality = 85;                     ///< 1..100, used by JPEG and WebP
    std::string format = "JPEG";          ///< target format name, case-insensitive
    std::optional<int> max_width;         ///< unset: no width cap
    std::optional<int> max_height;        ///< unset: no height cap
    bool optimize = true;
    bool progressive = true;              ///< JPEG only
    bool backup_original = false;
    std::string output_suffix = "_compressed";
    bool delete_original_on_format_change = true;

    /**
     * @brief Load configuration from a YAML (or JSON) file.
     *
     * Keys that are missing keep their current value; "null" sizes clear the cap.
     * @param path Path to the configuration file.
     * @return true on success. On a parse error the error is logged, the
     * object is left unchanged and false is returned.
     */
    bool load_from_yaml(const std::filesystem::path& path);

    /**
     * @brief Load configuration from an already parsed YAML node.
     * @throws YAML::Exception if a key holds a value of the wrong type.
     */
    void load_from_node(const YAML::Node& node);

    /**
     * @brief Write every key to @p path as YAML.
     * @return false (and logs) if the file cannot be written.
     */
    bool save_to_yaml(const std::filesystem::path& path) const;

    /**
     * @brief Check ranges and the target format.
     * @throws ConfigError with ErrorKind::InvalidConfig for out-of-range values,
     * ErrorKind::UnsupportedFormat for an unknown format name.
     */
    void validate() const;

    /**
     * @brief Resolved target format.
     * @throws ConfigError(UnsupportedFormat) if @c format is not a known name.
     */
    [[nodiscard]] ImageFormat target_format() const;

    /**
     * @brief Log a configuration summary at Info level.
     */
    void print() const;
};

} // namespace imgpress

#endif // IMGPRESS_CONFIG_HPP
