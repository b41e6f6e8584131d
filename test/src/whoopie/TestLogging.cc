#include "Logging.hh"

#include <gtest/gtest.h>

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {
using namespace std::string_view_literals;
constexpr auto MESSAGE = "This is logging"sv;
}

class LoggingTest : public testing::Test {
protected:
    virtual void SetUp()
    {
        setupLogging(Whoopie::LogLevel::WARNING, stream);
    }

    virtual void TearDown()
    {
        setupLogging(Whoopie::LogLevel::NONE, std::cerr);
    }

    std::ostringstream stream;
};

TEST_F(LoggingTest, testLoggingWithTriggeringLevel)
{
    setupLogging(Whoopie::LogLevel::INFO, stream);
    log(Whoopie::LogLevel::INFO, "format %s format"sv, MESSAGE);
    EXPECT_NE(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testLoggingWithNonTriggeringLevel)
{
    log(Whoopie::LogLevel::DEBUG, "%s"sv, MESSAGE);
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testLoggingWithLevelNone)
{
    setupLogging(Whoopie::LogLevel::NONE, stream);
    log(Whoopie::LogLevel::FATAL, "%s"sv, MESSAGE);
    EXPECT_TRUE(stream.str().empty());
}

TEST_F(LoggingTest, testLoggingWithMissingFormatSpecifier)
{
    log(Whoopie::LogLevel::WARNING, ""sv, MESSAGE);
    EXPECT_EQ(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testLoggingWithInvalidFormatSpecifier)
{
    log(Whoopie::LogLevel::WARNING, "%"sv, MESSAGE);
    EXPECT_EQ(std::string::npos, stream.str().find(MESSAGE));
}

TEST_F(LoggingTest, testLoggingOptionalAndVector)
{
    log(Whoopie::LogLevel::WARNING, "%s %s %s"sv,
        std::optional<int> {}, std::optional<int> {5}, std::vector {1, 2});
    EXPECT_NE(std::string::npos, stream.str().find("(none) 5 [1, 2]"));
}

TEST_F(LoggingTest, testLoggingToHandler)
{
    auto records = std::vector<std::pair<Whoopie::LogLevel, std::string>> {};
    setupLogging(
        Whoopie::LogLevel::ERROR,
        [&records](const auto level, const auto message)
        {
            records.emplace_back(level, std::string {message});
        });
    log(Whoopie::LogLevel::ERROR, "value %d"sv, 42);
    log(Whoopie::LogLevel::WARNING, "ignored"sv);
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ(Whoopie::LogLevel::ERROR, records[0].first);
    EXPECT_EQ("value 42", records[0].second);
}

TEST_F(LoggingTest, testVerbosity)
{
    EXPECT_EQ(Whoopie::LogLevel::WARNING, Whoopie::getLogLevel(0));
    EXPECT_EQ(Whoopie::LogLevel::INFO, Whoopie::getLogLevel(1));
    EXPECT_EQ(Whoopie::LogLevel::DEBUG, Whoopie::getLogLevel(2));
}
