#include <gtest/gtest.h>
#include <tlviz/logger.hpp>
#include <vector>

using namespace tlviz;

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(LogLevel::Trace);
        Logger::instance().add_sink([this](const Logger::LogEntry& e) { entries_.push_back(e); });
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(LogLevel::Info);
    }

    std::vector<Logger::LogEntry> entries_;
};

TEST_F(LoggerTest, MacroFormatsPlaceholders)
{
    TLVIZ_LOG_INFO("viewport", "window [{}, {}) zoom {}", 0, 20, std::string("4"));

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, "viewport");
    EXPECT_EQ(entries_[0].message, "window [0, 20) zoom 4");
}

TEST_F(LoggerTest, SurplusPlaceholdersKept)
{
    TLVIZ_LOG_DEBUG("merge", "{} and {}", "one");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "one and {}");
}

TEST_F(LoggerTest, ArgumentContainingBracesNotReplaced)
{
    TLVIZ_LOG_INFO("config", "{} {}", "{}", "x");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "{} x");
}

TEST_F(LoggerTest, LevelFiltering)
{
    Logger::instance().set_level(LogLevel::Warning);
    TLVIZ_LOG_DEBUG("hover", "dropped");
    TLVIZ_LOG_INFO("hover", "dropped");
    TLVIZ_LOG_WARN("hover", "kept");
    TLVIZ_LOG_ERROR("hover", "kept");

    ASSERT_EQ(entries_.size(), 2u);
    EXPECT_EQ(entries_[0].level, LogLevel::Warning);
    EXPECT_EQ(entries_[1].level, LogLevel::Error);
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Info));
}

TEST_F(LoggerTest, LevelNames)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Trace), "TRACE");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Critical), "CRITICAL");
}

TEST_F(LoggerTest, SinkManagement)
{
    EXPECT_EQ(Logger::instance().sink_count(), 1u);
    Logger::instance().add_sink(sinks::null_sink());
    EXPECT_EQ(Logger::instance().sink_count(), 2u);
    Logger::instance().clear_sinks();
    EXPECT_EQ(Logger::instance().sink_count(), 0u);
}
