/**
 * @file stats_aggregator.hpp
 * @brief Thread-safe run totals and the final report.
 */

#ifndef IMGPRESS_STATS_AGGREGATOR_HPP
#define IMGPRESS_STATS_AGGREGATOR_HPP

#include "compression_result.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>

namespace imgpress {

/**
 * @brief Counters accumulated over a run.
 */
struct Stats {
    std::size_t processed = 0;
    std::size_t errors = 0;
    std::uintmax_t total_original_bytes = 0;
    std::uintmax_t total_compressed_bytes = 0;
    std::size_t total_directories = 0;
    std::size_t processed_directories = 0;
};

/**
 * @brief Stats plus the derived figures printed at the end of a run.
 */
struct Report {
    Stats stats;
    double original_mb = 0.0;
    double compressed_mb = 0.0;
    double saved_mb = 0.0;
    double reduction_percent = 0.0; ///< (1 - compressed/original) * 100, 0 if nothing was read
};

/**
 * @brief Accumulates CompressionResult values from many workers.
 *
 * Every mutation holds one mutex, so concurrent record() calls never lose
 * updates.
 */
class StatsAggregator {
public:
    /**
     * @brief Fold one result into the totals.
     *
     * Success adds to processed and compressed bytes, failure to errors;
     * original bytes are added either way. Cancelled results are ignored.
     */
    void record(const CompressionResult& result);

    void add_directories(std::size_t count);

    void mark_directory_processed();

    [[nodiscard]] Stats snapshot() const;

    /**
     * @brief Compute the report from the current totals.
     */
    [[nodiscard]] Report finalize() const;

private:
    mutable std::mutex mtx_;
    Stats stats_;
};

} // namespace imgpress

#endif // IMGPRESS_STATS_AGGREGATOR_HPP
