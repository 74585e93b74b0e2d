#include "../libimgpress/include/logger.hpp"
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace imgpress;

namespace {

struct Captured {
    LogLevel level;
    std::string message;
    std::string tag;
};

class CaptureSink final : public ILogSink {
public:
    explicit CaptureSink(std::vector<Captured>& out) : out_(out) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        out_.push_back({level, std::string(message), std::string(tag)});
    }

private:
    std::vector<Captured>& out_;
};

} // namespace

TEST(Logger, ForwardsToEverySink) {
    std::vector<Captured> first;
    std::vector<Captured> second;
    Logger::clear_sinks();
    Logger::add_sink(std::make_unique<CaptureSink>(first));
    Logger::add_sink(std::make_unique<CaptureSink>(second));

    Logger::log(LogLevel::Warning, "Directory not found: x", "walker");
    Logger::log(LogLevel::Info, "hello");
    Logger::clear_sinks();
    Logger::log(LogLevel::Error, "dropped");

    ASSERT_EQ(first.size(), 2u);
    ASSERT_EQ(second.size(), 2u);
    EXPECT_EQ(first[0].level, LogLevel::Warning);
    EXPECT_EQ(first[0].message, "Directory not found: x");
    EXPECT_EQ(first[0].tag, "walker");
    EXPECT_EQ(first[1].tag, "imgpress");
}

TEST(Logger, ParsesLevelNames) {
    EXPECT_EQ(Logger::string_to_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::string_to_level("INFO"), LogLevel::Info);
    EXPECT_EQ(Logger::string_to_level("Warn"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("WARNING"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("error"), LogLevel::Error);
    EXPECT_FALSE(Logger::string_to_level("NONE").has_value());
    EXPECT_STREQ(Logger::level_to_string(LogLevel::Warning), "WARN");
}
