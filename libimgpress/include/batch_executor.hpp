/**
 * @file batch_executor.hpp
 * @brief Runs the compression pipeline over directory batches on a thread pool.
 */

#ifndef IMGPRESS_BATCH_EXECUTOR_HPP
#define IMGPRESS_BATCH_EXECUTOR_HPP

#include "codec_registry.hpp"
#include "compression_pipeline.hpp"
#include "config.hpp"
#include "directory_walker.hpp"
#include "event_bus.hpp"
#include "stats_aggregator.hpp"
#include "thread_pool.hpp"
#include <atomic>
#include <thread>
#include <utility>
#include <vector>

namespace imgpress {

/**
 * @brief Orchestrates a compression run.
 *
 * @details Every file of every batch becomes one ThreadPool task that runs
 * CompressionPipeline::process, records the result in the StatsAggregator
 * exactly once and publishes the outcome on the EventBus. A directory counts
 * as processed when its last file has finished.
 *
 * Cancellation (request_stop) drops queued files; running files either
 * finish or stop before writing anything. Dropped and cancelled files are
 * not recorded. An exception thrown by a subscriber after a file was
 * recorded still counts that file towards its directory.
 */
class BatchExecutor {
public:
    /**
     * @param config Validated configuration; must outlive the executor.
     * @param registry Codec registry; must outlive the executor.
     * @param stats Totals to update.
     * @param bus Bus used to publish progress and results.
     * @param threads Number of worker threads; 0 is treated as 1.
     * @throws ConfigError(UnsupportedFormat) if no codec writes the target format.
     */
    BatchExecutor(const CompressionConfig& config,
                  const CodecRegistry& registry,
                  StatsAggregator& stats,
                  EventBus& bus,
                  unsigned threads = std::thread::hardware_concurrency());

    /**
     * @brief Process all batches and block until every queued file is done
     * or dropped.
     */
    void process(const std::vector<DirectoryBatch>& batches);

    /**
     * @brief Checks if a stop has been requested.
     */
    [[nodiscard]] bool is_stopped() const {
        return stop_flag_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Request the executor and its thread pool to stop.
     *
     * Thread-safe, but it takes the pool's lock: never call it from an
     * asynchronous signal handler.
     */
    void request_stop();

    /// File tasks that ended with an exception, e.g. from an event subscriber.
    [[nodiscard]] std::size_t failed_tasks() const { return pool_.failed_tasks(); }

private:
    struct DirectoryProgress {
        DirectoryProgress(std::filesystem::path dir, const std::size_t files)
            : directory(std::move(dir)), remaining(files) {}

        std::filesystem::path directory;
        std::atomic<std::size_t> remaining; ///< files not finished yet
    };

    void process_file(const std::filesystem::path& file,
                      DirectoryProgress& progress,
                      const std::stop_token& st);

    void finish_file(DirectoryProgress& progress);

    void complete_directory(const std::filesystem::path& directory);

    CompressionPipeline pipeline_;
    StatsAggregator& stats_;
    EventBus& event_bus_;
    std::atomic<bool> stop_flag_{false};
    ThreadPool pool_; ///< declared last: workers are joined before the members they use go away
};

} // namespace imgpress

#endif // IMGPRESS_BATCH_EXECUTOR_HPP
