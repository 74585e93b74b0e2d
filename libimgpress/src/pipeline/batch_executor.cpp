#include "../../include/batch_executor.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include <memory>

namespace fs = std::filesystem;

namespace imgpress {

namespace {

constexpr std::string_view kTag = "executor";

} // namespace

BatchExecutor::BatchExecutor(const CompressionConfig& config,
                             const CodecRegistry& registry,
                             StatsAggregator& stats,
                             EventBus& bus,
                             const unsigned threads)
    : pipeline_(config, registry),
      stats_(stats),
      event_bus_(bus),
      pool_(threads) {
    Logger::log(LogLevel::Debug, "Executor started with " + std::to_string(pool_.size()) + " workers", kTag);
}

void BatchExecutor::process(const std::vector<DirectoryBatch>& batches) {
    stats_.add_directories(batches.size());

    // progress objects must outlive every task referencing them
    std::vector<std::unique_ptr<DirectoryProgress>> progress;
    progress.reserve(batches.size());

    for (const auto& batch : batches) {
        if (is_stopped()) break;

        Logger::log(LogLevel::Info, "Processing directory: " + batch.directory.filename().string(), kTag);
        event_bus_.publish(DirectoryStartEvent{batch.directory, batch.files.size()});

        if (batch.files.empty()) {
            complete_directory(batch.directory);
            continue;
        }

        auto& dir_progress = *progress.emplace_back(
            std::make_unique<DirectoryProgress>(batch.directory, batch.files.size()));

        for (const auto& file : batch.files) {
            if (is_stopped()) break;
            try {
                pool_.enqueue([this, file, &dir_progress](const std::stop_token& st) {
                    process_file(file, dir_progress, st);
                });
            } catch (const std::runtime_error& e) {
                // pool was stopped between the check above and enqueue
                Logger::log(LogLevel::Debug, std::string("Enqueue refused: ") + e.what(), kTag);
                break;
            }
        }
    }

    pool_.wait_idle();

    if (const auto failed = pool_.failed_tasks(); failed > 0) {
        Logger::log(LogLevel::Warning, std::to_string(failed) + " file tasks ended with an exception", kTag);
    }
}

void BatchExecutor::process_file(const fs::path& file, DirectoryProgress& progress, const std::stop_token& st) {
    if (st.stop_requested() || is_stopped()) {
        event_bus_.publish(FileProcessSkippedEvent{file, "Interrupted"});
        return;
    }
    event_bus_.publish(FileProcessStartEvent{file});

    const CompressionResult result = pipeline_.process(file, st);
    if (result.error_kind == ErrorKind::Cancelled) {
        event_bus_.publish(FileProcessSkippedEvent{file, result.error_message});
        return;
    }

    stats_.record(result);

    // the file is accounted for now; a throwing subscriber must not stall its directory
    try {
        if (result.success) {
            event_bus_.publish(FileProcessCompleteEvent{result});
        } else {
            event_bus_.publish(FileProcessErrorEvent{result});
        }
    } catch (...) {
        finish_file(progress);
        throw;
    }
    finish_file(progress);
}

void BatchExecutor::finish_file(DirectoryProgress& progress) {
    if (progress.remaining.fetch_sub(1, std::memory_order_acq_rel) == 1) {
        complete_directory(progress.directory);
    }
}

void BatchExecutor::complete_directory(const fs::path& directory) {
    stats_.mark_directory_processed();
    Logger::log(LogLevel::Debug, "Directory done: " + directory.string(), kTag);
    event_bus_.publish(DirectoryCompleteEvent{directory});
}

void BatchExecutor::request_stop() {
    stop_flag_.store(true, std::memory_order_relaxed);
    pool_.request_stop();
}

} // namespace imgpress
