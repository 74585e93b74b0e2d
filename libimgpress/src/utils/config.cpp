/**
 * @file config.cpp
 * @brief Configuration file parsing, writing and validation.
 */

#include "../../include/config.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <fstream>
#include <sstream>

namespace imgpress {

namespace {

constexpr std::string_view kTag = "config";

// Helper function to safely get YAML value with default
template<typename T>
T get_yaml_value(const YAML::Node& node, const std::string& key, const T& default_value) {
    if (node[key]) {
        return node[key].as<T>();
    }
    return default_value;
}

// missing key keeps the current value, explicit null clears it
std::optional<int> get_optional_size(const YAML::Node& node,
                                     const std::string& key,
                                     const std::optional<int>& current) {
    const YAML::Node value = node[key];
    if (!value) {
        return current;
    }
    if (value.IsNull()) {
        return std::nullopt;
    }
    return value.as<int>();
}

} // namespace

bool CompressionConfig::load_from_yaml(const std::filesystem::path& path) {
    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) {
            Logger::log(LogLevel::Error, "Configuration root must be a mapping: " + path.string(), kTag);
            return false;
        }
        CompressionConfig loaded = *this;
        loaded.load_from_node(root);
        *this = std::move(loaded);
        Logger::log(LogLevel::Info, "Loaded configuration from " + path.string(), kTag);
        return true;
    } catch (const YAML::Exception& e) {
        Logger::log(LogLevel::Error, "YAML parsing error in " + path.string() + ": " + e.what(), kTag);
        return false;
    }
}

void CompressionConfig::load_from_node(const YAML::Node& node) {
    quality = get_yaml_value(node, "quality", quality);
    format = get_yaml_value(node, "format", format);
    max_width = get_optional_size(node, "max_width", max_width);
    max_height = get_optional_size(node, "max_height", max_height);
    optimize = get_yaml_value(node, "optimize", optimize);
    progressive = get_yaml_value(node, "progressive", progressive);
    backup_original = get_yaml_value(node, "backup_original", backup_original);
    output_suffix = get_yaml_value(node, "output_suffix", output_suffix);
    delete_original_on_format_change =
        get_yaml_value(node, "delete_original_on_format_change", delete_original_on_format_change);
}

bool CompressionConfig::save_to_yaml(const std::filesystem::path& path) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "quality" << YAML::Value << quality;
    out << YAML::Key << "format" << YAML::Value << format;
    out << YAML::Key << "max_width";
    if (max_width) out << YAML::Value << *max_width; else out << YAML::Value << YAML::Null;
    out << YAML::Key << "max_height";
    if (max_height) out << YAML::Value << *max_height; else out << YAML::Value << YAML::Null;
    out << YAML::Key << "optimize" << YAML::Value << optimize;
    out << YAML::Key << "progressive" << YAML::Value << progressive;
    out << YAML::Key << "backup_original" << YAML::Value << backup_original;
    out << YAML::Key << "output_suffix" << YAML::Value << output_suffix;
    out << YAML::Key << "delete_original_on_format_change" << YAML::Value << delete_original_on_format_change;
    out << YAML::EndMap;

    std::ofstream file(path);
    if (!file) {
        Logger::log(LogLevel::Error, "Cannot write configuration file: " + path.string(), kTag);
        return false;
    }
    file << out.c_str() << "\n";
    if (!file) {
        Logger::log(LogLevel::Error, "Failed writing configuration file: " + path.string(), kTag);
        return false;
    }
    Logger::log(LogLevel::Info, "Wrote default configuration to " + path.string(), kTag);
    return true;
}

ImageFormat CompressionConfig::target_format() const {
    const auto parsed = parse_image_format(format);
    if (!parsed) {
        throw ConfigError(ErrorKind::UnsupportedFormat, "Unsupported target format: " + format);
    }
    return *parsed;
}

void CompressionConfig::validate() const {
    if (quality < 1 || quality > 100) {
        throw ConfigError(ErrorKind::InvalidConfig,
                          "quality must be in [1, 100], got " + std::to_string(quality));
    }
    if (max_width && *max_width <= 0) {
        throw ConfigError(ErrorKind::InvalidConfig,
                          "max_width must be > 0, got " + std::to_string(*max_width));
    }
    if (max_height && *max_height <= 0) {
        throw ConfigError(ErrorKind::InvalidConfig,
                          "max_height must be > 0, got " + std::to_string(*max_height));
    }
    (void)target_format();

    if (backup_original && delete_original_on_format_change) {
        Logger::log(LogLevel::Warning,
                    "backup_original and delete_original_on_format_change are both set: "
                    "originals are still deleted when the format changes",
                    kTag);
    }
}

void CompressionConfig::print() const {
    std::ostringstream oss;
    oss << "Configuration: format=" << format
        << " quality=" << quality
        << " max_width=" << (max_width ? std::to_string(*max_width) : "none")
        << " max_height=" << (max_height ? std::to_string(*max_height) : "none")
        << " optimize=" << std::boolalpha << optimize
        << " progressive=" << progressive
        << " backup_original=" << backup_original
        << " output_suffix='" << output_suffix << "'"
        << " delete_original_on_format_change=" << delete_original_on_format_change;
    Logger::log(LogLevel::Info, oss.str(), kTag);
}

} // namespace imgpress
