#include "Logging.hh"

#include <gtest/gtest.h>

#include <iostream>
#include <sstream>
#include <string>

using Trio::LogLevel;

class LoggingTest : public testing::Test {
protected:
    virtual void TearDown()
    {
        setupLogging(LogLevel::NONE, std::cerr);
    }

    std::ostringstream stream;
};

TEST_F(LoggingTest, testPlaceholdersAreReplaced)
{
    setupLogging(LogLevel::INFO, stream);
    log(LogLevel::INFO, "Room %s created. Players: %d", "ABC12", 3);
    EXPECT_NE(std::string::npos, stream.str().find("Room ABC12 created"));
    EXPECT_NE(std::string::npos, stream.str().find("Players: 3"));
}

TEST_F(LoggingTest, testMessageBelowLevelIsDropped)
{
    setupLogging(LogLevel::WARNING, stream);
    log(LogLevel::DEBUG, "Publishing event: %s", "game_state");
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testLevelNoneDropsEverything)
{
    setupLogging(LogLevel::NONE, stream);
    log(LogLevel::FATAL, "Shutting down");
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testVerbosity)
{
    EXPECT_EQ(LogLevel::WARNING, Trio::getLogLevel(0));
    EXPECT_EQ(LogLevel::INFO, Trio::getLogLevel(1));
    EXPECT_EQ(LogLevel::DEBUG, Trio::getLogLevel(2));
    EXPECT_EQ(LogLevel::DEBUG, Trio::getLogLevel(5));
}
