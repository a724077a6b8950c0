#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <knotview/logger.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace knotview;

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        auto& logger = Logger::instance();
        saved_level_ = logger.get_level();
        logger.clear_sinks();
        logger.set_level(LogLevel::Trace);
        logger.add_sink([this](const Logger::LogEntry& e) { entries_.push_back(e); });
    }

    void TearDown() override
    {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_level(saved_level_);
    }

    std::vector<Logger::LogEntry> entries_;
    LogLevel                      saved_level_ = LogLevel::Info;
};

TEST_F(LoggerTest, ForwardsToSinks)
{
    Logger::instance().log(LogLevel::Info, "resolver", "picked svg");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, "resolver");
    EXPECT_EQ(entries_[0].message, "picked svg");
}

TEST_F(LoggerTest, FiltersBelowLevel)
{
    Logger::instance().set_level(LogLevel::Warning);
    KNOTVIEW_LOG_DEBUG("test", "hidden");
    KNOTVIEW_LOG_INFO("test", "hidden");
    KNOTVIEW_LOG_WARN("test", "shown");
    KNOTVIEW_LOG_ERROR("test", "shown");
    ASSERT_EQ(entries_.size(), 2u);
    EXPECT_EQ(entries_[0].level, LogLevel::Warning);
    EXPECT_EQ(entries_[1].level, LogLevel::Error);
}

TEST_F(LoggerTest, FormatsPlaceholders)
{
    KNOTVIEW_LOG_INFO("test", "{} of {} curves, clear={}", 3, 7, true);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "3 of 7 curves, clear=true");
}

TEST_F(LoggerTest, FormatsStrings)
{
    std::string      backend = "raster";
    std::string_view reason  = "no display";
    KNOTVIEW_LOG_WARN("test", "{}: {} ({})", backend, reason, "skipped");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "raster: no display (skipped)");
}

TEST_F(LoggerTest, ExtraArgumentsAreIgnored)
{
    KNOTVIEW_LOG_INFO("test", "only {}", 1, 2);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "only 1");
}

TEST_F(LoggerTest, PlaceholderInArgumentIsNotExpanded)
{
    KNOTVIEW_LOG_INFO("test", "{} {}", "{}", 5);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "{} 5");
}

TEST_F(LoggerTest, FileSinkAppends)
{
    auto path = std::filesystem::temp_directory_path() / "knotview_logger_test.log";
    std::filesystem::remove(path);

    Logger::instance().add_sink(sinks::file_sink(path.string()));
    KNOTVIEW_LOG_ERROR("io", "write failed");

    std::ifstream     in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("ERROR [io] write failed"), std::string::npos);

    Logger::instance().clear_sinks();
    std::filesystem::remove(path);
}

TEST(LoggerLevels, NamesRoundTrip)
{
    for (auto level : {LogLevel::Trace,
                       LogLevel::Debug,
                       LogLevel::Info,
                       LogLevel::Warning,
                       LogLevel::Error,
                       LogLevel::Critical})
    {
        auto parsed = Logger::level_from_string(Logger::level_to_string(level));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, level);
    }
}

TEST(LoggerLevels, ParseIsCaseInsensitive)
{
    EXPECT_EQ(Logger::level_from_string("warning"), LogLevel::Warning);
    EXPECT_EQ(Logger::level_from_string("Debug"), LogLevel::Debug);
    EXPECT_FALSE(Logger::level_from_string("verbose").has_value());
}
