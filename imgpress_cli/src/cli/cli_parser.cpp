#include "cli_parser.hpp"
#include "../../../libimgpress/include/image_format.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <thread>

namespace {
// helper for validating the target format name
struct ImageFormatValidator : CLI::Validator {
    ImageFormatValidator() {
        name_ = "ImageFormat";
        func_ = [](const std::string& str) {
            if (!imgpress::parse_image_format(str).has_value()) {
                return std::string("Invalid format: '") + str +
                       "'. Must be one of: JPEG, PNG, WEBP, TIFF, BMP.";
            }
            return std::string(); // ok
        };
    }
};
} // namespace

void Settings::apply_overrides(imgpress::CompressionConfig& config) const {
    if (quality) config.quality = *quality;
    if (format) config.format = *format;
    if (max_width) config.max_width = *max_width;
    if (max_height) config.max_height = *max_height;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "1.0");

    // --- Flags (booleans) ---
    app.add_flag("-r,--recursive", settings.recursive,
                 "Recursively scan input folders.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress console output except the final summary.");

    // --- Configuration ---
    app.add_option("-c,--config", settings.config_path,
                   "Configuration file (YAML or JSON). Written with defaults if missing.")
                   ->default_val(settings.config_path.string());

    // --- Year-tree layout ---
    app.add_option("--base", settings.base,
                   "Dataset root used when no inputs are given.")
                   ->default_val(settings.base.string());

    app.add_option("--start-year", settings.start_year, "First year to process.")
        ->default_val(settings.start_year);

    app.add_option("--end-year", settings.end_year, "Last year to process (inclusive).")
        ->default_val(settings.end_year);

    app.add_option("--year-prefix", settings.year_prefix,
                   "Prefix of the per-year directories.")
                   ->default_val(settings.year_prefix);

    app.add_option("--dir-suffix", settings.dir_suffix,
                   "Suffix of the image directories inside each year.")
                   ->default_val(settings.dir_suffix);

    // --- Configuration overrides ---
    app.add_option("--quality", settings.quality, "Override quality (1-100).")
        ->check(CLI::Range(1, 100));

    app.add_option("--format", settings.format, "Override target format: JPEG, PNG, WEBP, TIFF, BMP.")
        ->check(ImageFormatValidator());

    app.add_option("--max-width", settings.max_width, "Override maximum output width.")
        ->check(CLI::PositiveNumber);

    app.add_option("--max-height", settings.max_height, "Override maximum output height.")
        ->check(CLI::PositiveNumber);

    // --- Execution and output ---
    settings.num_threads = std::max(1U, std::thread::hardware_concurrency());
    app.add_option("--threads", settings.num_threads,
                   "Threads to use for parallel compression.")
                   ->default_val(settings.num_threads)
                   ->check(CLI::PositiveNumber);

    app.add_option("--log-level", settings.log_level,
                   "Console log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("INFO")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "WARN", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Append logs to this file.")
                   ->default_val(settings.log_file.string());

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last();

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs,
                   "Files or directories to compress. Without inputs the year tree under --base is processed.")
        ->check([](const std::string& str) {
            if (!std::filesystem::exists(str)) return "Input path '" + str + "' not found.";
            return std::string(); // ok
        });

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.start_year > settings.end_year) {
            throw CLI::ValidationError("--start-year must not be after --end-year.");
        }
        if (settings.recursive && settings.inputs.empty()) {
            throw CLI::ValidationError("-r, --recursive requires at least one input directory.");
        }
    });
}
