#include "Logging.hh"

#include <gtest/gtest.h>

#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace {
using namespace std::string_view_literals;
constexpr auto MESSAGE = "This is logging"sv;
}

class LoggingTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        setupLogging(WarCheck::LogLevel::WARNING, stream);
    }

    virtual void TearDown()
    {
        setupLogging(WarCheck::LogLevel::NONE, std::cerr);
    }

    std::ostringstream stream;
};

TEST_F(LoggingTest, testLoggingWithTriggeringLevel)
{
    setupLogging(WarCheck::LogLevel::INFO, stream);
    log(WarCheck::LogLevel::INFO, "format %s format"sv, MESSAGE);
    EXPECT_NE(std::string::npos, stream.str().find(MESSAGE));
    EXPECT_NE(std::string::npos, stream.str().find("INFO"));
}

TEST_F(LoggingTest, testLoggingBelowTriggeringLevel)
{
    log(WarCheck::LogLevel::DEBUG, "%s"sv, MESSAGE);
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testLoggingWithLevelNone)
{
    setupLogging(WarCheck::LogLevel::NONE, stream);
    log(WarCheck::LogLevel::FATAL, "%s"sv, MESSAGE);
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testLoggingMessageWithLevelNoneIsIgnored)
{
    setupLogging(WarCheck::LogLevel::DEBUG, stream);
    log(WarCheck::LogLevel::NONE, "%s"sv, MESSAGE);
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testLoggingWithMissingFormatSpecifier)
{
    log(WarCheck::LogLevel::WARNING, ""sv, MESSAGE);
    EXPECT_EQ(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testLoggingWithInvalidFormatSpecifier)
{
    log(WarCheck::LogLevel::WARNING, "%"sv, MESSAGE);
    EXPECT_EQ(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testLoggingOptional)
{
    log(WarCheck::LogLevel::WARNING, "%s %s"sv, std::optional<int> {3},
        std::optional<int> {});
    EXPECT_NE(std::string::npos, stream.str().find("3 (none)"));
}

TEST_F(LoggingTest, testVerbosity)
{
    EXPECT_EQ(WarCheck::LogLevel::WARNING, WarCheck::getLogLevel(0));
    EXPECT_EQ(WarCheck::LogLevel::INFO, WarCheck::getLogLevel(1));
    EXPECT_EQ(WarCheck::LogLevel::DEBUG, WarCheck::getLogLevel(2));
}

TEST(LogLevelTest, testLogLevelFromString)
{
    EXPECT_EQ(WarCheck::LogLevel::DEBUG, WarCheck::logLevelFromString("debug"));
    EXPECT_EQ(WarCheck::LogLevel::NONE, WarCheck::logLevelFromString("none"));
    EXPECT_FALSE(WarCheck::logLevelFromString("DEBUG"));
}

TEST(LogLevelTest, testOutput)
{
    std::ostringstream os;
    os << WarCheck::LogLevel::WARNING;
    EXPECT_EQ("warning", os.str());
}
