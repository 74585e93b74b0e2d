#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/interrupt_watcher.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "../../libimgpress/include/batch_executor.hpp"
#include "../../libimgpress/include/codec_registry.hpp"
#include "../../libimgpress/include/config.hpp"
#include "../../libimgpress/include/directory_walker.hpp"
#include "../../libimgpress/include/errors.hpp"
#include "../../libimgpress/include/event_bus.hpp"
#include "../../libimgpress/include/events.hpp"
#include "../../libimgpress/include/logger.hpp"
#include "../../libimgpress/include/stats_aggregator.hpp"

// simple progress bar printer
inline void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos || (i == pos && done == total)) std::cerr << "=";
        else if (i == pos) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

using namespace imgpress;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};
static std::mutex g_executor_mutex;
static BatchExecutor* g_executor = nullptr; // guarded by g_executor_mutex

// ctrl+c or termination, delivered on the watcher thread
void on_interrupt(int) {
    std::cerr << CYAN
              << "\n[INTERRUPT] Stop detected. Waiting for running files to finish..."
              << RESET << std::endl;
    interrupted.store(true);
    std::lock_guard lock(g_executor_mutex);
    if (g_executor) {
        g_executor->request_stop();
    }
}

// publishes the executor to on_interrupt for its lifetime
struct ActiveExecutor {
    explicit ActiveExecutor(BatchExecutor& executor) {
        std::lock_guard lock(g_executor_mutex);
        g_executor = &executor;
        if (interrupted.load()) {
            executor.request_stop();
        }
    }
    ~ActiveExecutor() {
        std::lock_guard lock(g_executor_mutex);
        g_executor = nullptr;
    }
    ActiveExecutor(const ActiveExecutor&) = delete;
    ActiveExecutor& operator=(const ActiveExecutor&) = delete;
};

// configuration file first (written with defaults if missing), then command-line overrides
static CompressionConfig load_configuration(const Settings& settings) {
    CompressionConfig config;
    if (!fs::exists(settings.config_path)) {
        if (!config.save_to_yaml(settings.config_path)) {
            Logger::log(LogLevel::Warning, "Continuing with the default configuration", "config");
        }
    } else if (!config.load_from_yaml(settings.config_path)) {
        Logger::log(LogLevel::Warning, "Using default configuration", "config");
    }
    settings.apply_overrides(config);
    return config;
}

int main(int argc, char* argv[]) {

    CLI::App app{"imgpress: batch image recompression for year-organized datasets."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    // before any worker thread exists
    InterruptWatcher interrupt_watcher(on_interrupt);

    // set file logger
    Logger::clear_sinks();
    auto file_sink = std::make_unique<FileLogSink>(settings.log_file, true);
    if (!file_sink->is_open()) {
        std::cerr << YELLOW << "Cannot open log file " << settings.log_file.string() << RESET << std::endl;
    }
    Logger::add_sink(std::move(file_sink));

    // console logger: NONE disables it, quiet keeps errors only
    const auto console_level = Logger::string_to_level(settings.log_level);
    if (console_level) {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = settings.quiet ? LogLevel::Error : *console_level;
        Logger::add_sink(std::move(console_sink));
    }
    // the bar would be torn apart by per-file Info lines
    const bool show_progress = !settings.quiet && (!console_level || *console_level > LogLevel::Info);

    CompressionConfig config = load_configuration(settings);
    try {
        config.validate();
    } catch (const ConfigError& e) {
        Logger::log(LogLevel::Error, std::string("Invalid configuration: ") + e.what(), "config");
        std::cerr << RED << "Invalid configuration: " << e.what() << RESET << std::endl;
        return 1;
    }
    config.print();

    // collect work
    std::vector<DirectoryBatch> batches;
    if (settings.year_tree_mode()) {
        if (!fs::is_directory(settings.base)) {
            Logger::log(LogLevel::Error, "Base path not found: " + settings.base.string(), "main");
            std::cerr << RED << "Base path not found: " << settings.base.string() << RESET << std::endl;
            return 1;
        }
        batches = DirectoryWalker::walk_year_tree(settings.layout());
    } else {
        batches = DirectoryWalker::collect_inputs(settings.inputs, settings.recursive);
    }

    size_t total = 0;
    for (const auto& batch : batches) {
        total += batch.files.size();
    }
    Logger::log(LogLevel::Info,
                "Queued " + std::to_string(total) + " images in " + std::to_string(batches.size()) + " directories",
                "main");

    CodecRegistry registry;
    StatsAggregator stats;
    EventBus bus;

    // results collected for the CSV report
    std::vector<CompressionResult> results;

    // progress tracking
    size_t done = 0;
    const auto start_total = std::chrono::steady_clock::now();

    // handlers never run concurrently: the bus serializes them
    auto on_finish = [&](auto&&) {
        const size_t current = ++done;
        if (show_progress) {
            const double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - start_total).count();
            print_progress_bar(current, total, elapsed);
        }
    };

    bus.subscribe<FileProcessCompleteEvent>([&](const FileProcessCompleteEvent& e) {
        results.push_back(e.result);
        on_finish(e);
    });

    bus.subscribe<FileProcessErrorEvent>([&](const FileProcessErrorEvent& e) {
        results.push_back(e.result);
        on_finish(e);
    });

    bus.subscribe<FileProcessSkippedEvent>(on_finish);

    try {
        BatchExecutor executor(config, registry, stats, bus, settings.num_threads);
        const ActiveExecutor active(executor);
        executor.process(batches);
    } catch (const ConfigError& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << e.what() << RESET << std::endl;
        return 1;
    }

    if (show_progress && total > 0) {
        std::cerr << std::endl;
    }

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    const Report report = stats.finalize();
    print_summary_report(report, settings.num_threads, total_seconds);

    // export CSV if requested
    if (!settings.report_path.empty()) {
        if (!export_csv_report(results, report, settings.report_path, total_seconds)) {
            Logger::log(LogLevel::Error, "Cannot write report to " + settings.report_path.string(), "main");
        }
    }

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    return 0;
}
