#include "../libimgpress/include/stats_aggregator.hpp"
#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace imgpress;

namespace {

CompressionResult ok(const std::uintmax_t before, const std::uintmax_t after) {
    CompressionResult r;
    r.success = true;
    r.original_size = before;
    r.compressed_size = after;
    return r;
}

CompressionResult failed(const ErrorKind kind, const std::uintmax_t before = 0) {
    CompressionResult r;
    r.success = false;
    r.error_kind = kind;
    r.original_size = before;
    return r;
}

} // namespace

TEST(StatsAggregator, StartsEmpty) {
    StatsAggregator stats;
    const auto report = stats.finalize();
    EXPECT_EQ(report.stats.processed, 0u);
    EXPECT_EQ(report.stats.errors, 0u);
    EXPECT_DOUBLE_EQ(report.reduction_percent, 0.0);
    EXPECT_DOUBLE_EQ(report.saved_mb, 0.0);
}

TEST(StatsAggregator, RecordsSuccessAndFailure) {
    StatsAggregator stats;
    stats.record(ok(1000, 400));
    stats.record(failed(ErrorKind::DecodeError, 200));
    stats.record(failed(ErrorKind::NotFound));

    const auto s = stats.snapshot();
    EXPECT_EQ(s.processed, 1u);
    EXPECT_EQ(s.errors, 2u);
    EXPECT_EQ(s.total_original_bytes, 1200u); // read before the decode failed
    EXPECT_EQ(s.total_compressed_bytes, 400u);
}

TEST(StatsAggregator, CancelledResultsAreIgnored) {
    StatsAggregator stats;
    stats.record(failed(ErrorKind::Cancelled, 5000));
    const auto s = stats.snapshot();
    EXPECT_EQ(s.errors, 0u);
    EXPECT_EQ(s.total_original_bytes, 0u);
}

TEST(StatsAggregator, FinalizeComputesMegabytes) {
    StatsAggregator stats;
    stats.record(ok(4 * 1024 * 1024, 1024 * 1024));
    stats.add_directories(3);
    stats.mark_directory_processed();

    const auto report = stats.finalize();
    EXPECT_DOUBLE_EQ(report.original_mb, 4.0);
    EXPECT_DOUBLE_EQ(report.compressed_mb, 1.0);
    EXPECT_DOUBLE_EQ(report.saved_mb, 3.0);
    EXPECT_DOUBLE_EQ(report.reduction_percent, 75.0);
    EXPECT_EQ(report.stats.total_directories, 3u);
    EXPECT_EQ(report.stats.processed_directories, 1u);
}

TEST(StatsAggregator, ConcurrentRecordsAreNotLost) {
    StatsAggregator stats;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 5000;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&stats, t] {
            for (int i = 0; i < kPerThread; ++i) {
                if ((i + t) % 5 == 0) {
                    stats.record(failed(ErrorKind::EncodeError, 10));
                } else {
                    stats.record(ok(10, 4));
                }
                if (i % 1000 == 0) stats.mark_directory_processed();
            }
        });
    }
    for (auto& w : workers) w.join();

    const auto s = stats.snapshot();
    EXPECT_EQ(s.processed + s.errors, static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_EQ(s.errors, static_cast<std::size_t>(kThreads * kPerThread / 5));
    EXPECT_EQ(s.total_original_bytes, static_cast<std::uintmax_t>(kThreads * kPerThread * 10));
    EXPECT_EQ(s.total_compressed_bytes, s.processed * 4);
    EXPECT_EQ(s.processed_directories, static_cast<std::size_t>(kThreads * 5));
}
