#ifndef IMGPRESS_CLI_PARSER_HPP
#define IMGPRESS_CLI_PARSER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "../../../libimgpress/include/config.hpp"
#include "../../../libimgpress/include/directory_walker.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool recursive = false;
    bool quiet = false;

    std::filesystem::path config_path = "compression_config.yaml";

    // year-tree mode (used when no inputs are given)
    std::filesystem::path base = "assets/enem_data";
    int start_year = 2009;
    int end_year = 2023;
    std::string year_prefix = "enem-";
    std::string dir_suffix = "-images";

    // overrides applied on top of the configuration file
    std::optional<int> quality;
    std::optional<std::string> format;
    std::optional<int> max_width;
    std::optional<int> max_height;

    unsigned num_threads = 1;
    std::string log_level = "INFO";
    std::filesystem::path log_file = "compression.log";
    std::filesystem::path report_path;

    std::vector<std::filesystem::path> inputs;

    [[nodiscard]] bool year_tree_mode() const { return inputs.empty(); }

    [[nodiscard]] imgpress::YearTreeLayout layout() const {
        return {base, start_year, end_year, year_prefix, dir_suffix};
    }

    /**
     * @brief Copy every option given on the command line into config.
     */
    void apply_overrides(imgpress::CompressionConfig& config) const;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // IMGPRESS_CLI_PARSER_HPP
