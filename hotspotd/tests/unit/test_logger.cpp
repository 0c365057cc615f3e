#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include "core/logger.hpp"

using namespace hotspotd::core;

TEST(LogContextTest, FormatsFieldsInInsertionOrder)
{
    LogContext context;
    context.add("iface", "wlan0").add("channel", 6).add("ok", true);
    EXPECT_EQ(context.format(), "iface=wlan0 channel=6 ok=true");
}

TEST(LogContextTest, QuotesValuesWithSpaces)
{
    LogContext context;
    context.add("network", "Home Net").add("empty", "");
    EXPECT_EQ(context.format(), "network=\"Home Net\" empty=\"\"");
}

TEST(LogContextTest, EmptyContext)
{
    EXPECT_TRUE(LogContext().empty());
    EXPECT_EQ(LogContext().format(), "");
}

TEST(LoggerManagerTest, ParsesLevelNamesCaseInsensitively)
{
    EXPECT_EQ(LoggerManager::string_to_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(LoggerManager::string_to_level("Info"), LogLevel::INFO);
    EXPECT_EQ(LoggerManager::string_to_level("warn"), LogLevel::WARNING);
    EXPECT_EQ(LoggerManager::string_to_level("WARNING"), LogLevel::WARNING);
    EXPECT_EQ(LoggerManager::string_to_level("error"), LogLevel::ERROR);
    EXPECT_EQ(LoggerManager::string_to_level("crit"), LogLevel::CRITICAL);
    EXPECT_EQ(LoggerManager::string_to_level("verbose"), LogLevel::INFO);
}

TEST(LoggerManagerTest, SameNameSameLogger)
{
    auto first = get_logger("LoggerTest.Same");
    auto second = get_logger("LoggerTest.Same");
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first->name(), "LoggerTest.Same");
}

TEST(LoggerTest, LevelFiltering)
{
    Logger logger("filter", LogLevel::WARNING);
    EXPECT_FALSE(logger.is_enabled(LogLevel::DEBUG));
    EXPECT_FALSE(logger.is_enabled(LogLevel::INFO));
    EXPECT_TRUE(logger.is_enabled(LogLevel::WARNING));
    EXPECT_TRUE(logger.is_enabled(LogLevel::CRITICAL));
}

TEST(LoggerTest, WritesFormattedLinesToFile)
{
    std::string path = ::testing::TempDir() + "hotspotd_logger_test.log";
    std::remove(path.c_str());

    {
        Logger logger("FileLogger", LogLevel::INFO);
        logger.set_console_output(false);
        logger.set_output_file(path);
        logger.debug("hidden");
        logger.info("Hotspot up", LogContext().add("iface", "ap0"));
        logger.error("Broke");
    }

    std::ifstream stream(path);
    std::stringstream contents;
    contents << stream.rdbuf();
    std::string text = contents.str();

    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[INFO] FileLogger: Hotspot up iface=ap0"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] FileLogger: Broke"), std::string::npos);
    std::remove(path.c_str());
}
