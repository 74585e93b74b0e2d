#include "report_generator.hpp"
#include "../utils/color.hpp"
#include "../../../libimgpress/include/errors.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>

using namespace imgpress;

static bool is_stdout_a_tty() {
    return isatty(fileno(stdout)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

// 1234567 -> "1,234,567"
static std::string with_thousands(std::uintmax_t value) {
    std::string digits = std::to_string(value);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);
    const std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i % 3) == lead % 3) out.push_back(',');
        out.push_back(digits[i]);
    }
    return out;
}

void print_summary_report(const Report& report,
                          const unsigned num_threads,
                          const double total_seconds) {
    const bool use_colors = is_stdout_a_tty();
    const std::string rule(std::min(50u, get_terminal_width()), '=');
    const Stats& s = report.stats;

    std::cout << "\n" << rule << "\n"
              << (use_colors ? CYAN : "") << "COMPRESSION STATISTICS" << (use_colors ? RESET : "") << "\n"
              << rule << "\n";
    std::cout << "Images processed: " << with_thousands(s.processed) << "\n";
    std::cout << "Errors: ";
    if (use_colors && s.errors > 0) std::cout << RED << with_thousands(s.errors) << RESET;
    else std::cout << with_thousands(s.errors);
    std::cout << "\n";
    std::cout << "Directories processed: " << with_thousands(s.processed_directories) << "\n";
    std::cout << "Total directories: " << with_thousands(s.total_directories) << "\n";

    if (s.total_original_bytes > 0) {
        std::cout << std::fixed << std::setprecision(2)
                  << "Total original size: " << report.original_mb << " MB"
                  << " (" << with_thousands(s.total_original_bytes) << " bytes)\n"
                  << "Total compressed size: " << report.compressed_mb << " MB"
                  << " (" << with_thousands(s.total_compressed_bytes) << " bytes)\n"
                  << std::setprecision(1)
                  << "Total reduction: " << report.reduction_percent << "%\n"
                  << std::setprecision(2)
                  << "Space saved: " << (use_colors ? GREEN : "") << report.saved_mb << " MB"
                  << (use_colors ? RESET : "") << "\n";
    }

    std::cout << "Total time: " << std::fixed << std::setprecision(2)
              << total_seconds << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
    std::cout << rule << std::endl;
}

bool export_csv_report(const std::vector<CompressionResult>& results,
                       const Report& report,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "File,Output,Before(bytes),After(bytes),Reduction(%),Time(s),Result,Error\n";

    auto sorted = results;
    std::ranges::sort(sorted, [](const auto& a, const auto& b) {
        return a.input_path < b.input_path;
    });

    for (const auto& r : sorted) {
        const std::string outcome = r.success
            ? (r.format_changed ? "OK (converted)" : "OK")
            : "FAIL (" + std::string(error_kind_to_string(r.error_kind)) + ")";

        out << csv_escape(r.input_path.string()) << ","
            << csv_escape(r.success ? r.output_path.string() : "") << ","
            << r.original_size << ","
            << r.compressed_size << ",";

        std::ostringstream osspct;
        osspct << std::fixed << std::setprecision(2) << r.compression_ratio() * 100.0;
        out << osspct.str() << ",";

        std::ostringstream osstime;
        osstime << std::fixed << std::setprecision(2)
                << static_cast<double>(r.duration.count()) / 1000.0;
        out << osstime.str() << ","
            << csv_escape(outcome) << ","
            << csv_escape(r.error_message) << "\n";
    }

    const Stats& s = report.stats;
    out << "\n\nProcessed,Errors,Directories processed,Total directories,"
           "Original(bytes),Compressed(bytes),Reduction(%),Total time(s)\n";
    out << s.processed << "," << s.errors << ","
        << s.processed_directories << "," << s.total_directories << ","
        << s.total_original_bytes << "," << s.total_compressed_bytes << ","
        << std::fixed << std::setprecision(2) << report.reduction_percent << ","
        << total_seconds << "\n";

    return static_cast<bool>(out);
}
