#include "../../include/stats_aggregator.hpp"

namespace imgpress {

namespace {

constexpr double kBytesPerMb = 1024.0 * 1024.0;

} // namespace

void StatsAggregator::record(const CompressionResult& result) {
    if (result.error_kind == ErrorKind::Cancelled) {
        return;
    }
    std::lock_guard lock(mtx_);
    stats_.total_original_bytes += result.original_size;
    if (result.success) {
        ++stats_.processed;
        stats_.total_compressed_bytes += result.compressed_size;
    } else {
        ++stats_.errors;
    }
}

void StatsAggregator::add_directories(const std::size_t count) {
    std::lock_guard lock(mtx_);
    stats_.total_directories += count;
}

void StatsAggregator::mark_directory_processed() {
    std::lock_guard lock(mtx_);
    ++stats_.processed_directories;
}

Stats StatsAggregator::snapshot() const {
    std::lock_guard lock(mtx_);
    return stats_;
}

Report StatsAggregator::finalize() const {
    Report report;
    report.stats = snapshot();
    report.original_mb = static_cast<double>(report.stats.total_original_bytes) / kBytesPerMb;
    report.compressed_mb = static_cast<double>(report.stats.total_compressed_bytes) / kBytesPerMb;
    report.saved_mb = report.original_mb - report.compressed_mb;
    if (report.stats.total_original_bytes > 0) {
        report.reduction_percent =
            (1.0 - static_cast<double>(report.stats.total_compressed_bytes) /
                   static_cast<double>(report.stats.total_original_bytes)) * 100.0;
    }
    return report;
}

} // namespace imgpress
