#ifndef IMGPRESS_REPORT_GENERATOR_HPP
#define IMGPRESS_REPORT_GENERATOR_HPP

#include <filesystem>
#include <vector>
#include "../../../libimgpress/include/compression_result.hpp"
#include "../../../libimgpress/include/stats_aggregator.hpp"

/**
 * @brief Width of the terminal attached to stdout, 80 if unknown.
 */
unsigned get_terminal_width();

/**
 * @brief Print the end-of-run statistics block to stdout.
 *
 * Size totals are only printed when at least one byte was read.
 */
void print_summary_report(const imgpress::Report& report,
                          unsigned num_threads,
                          double total_seconds);

/**
 * @brief Write one CSV row per processed file, followed by the run totals.
 * @return false if the file could not be written.
 */
bool export_csv_report(const std::vector<imgpress::CompressionResult>& results,
                       const imgpress::Report& report,
                       const std::filesystem::path& output_path,
                       double total_seconds);

#endif // IMGPRESS_REPORT_GENERATOR_HPP
