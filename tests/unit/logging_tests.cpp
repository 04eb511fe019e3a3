#include <sstream>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <aiomega/common/log_level.h>
#include <aiomega/common/logging.h>
#include <aiomega/common/simple_logger.h>
#include <aiomega/common/subsystem_logger.h>

#include <mock_log_output.h>

namespace aiomega
{
namespace testing
{

using namespace common;

using ::testing::_;
using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::StrEq;

class LoggingTests
  : public ::testing::Test
{
public:
    LoggingTests()
      : Test()
      , mLevel(SimpleLogger::getLogLevel())
      , mOutput()
      , mPrevious(SimpleLogger::getOutputClass())
    {
        SimpleLogger::setOutputClass(&mOutput);
    }

    ~LoggingTests()
    {
        SimpleLogger::setOutputClass(mPrevious);
        SimpleLogger::setLogLevel(mLevel);
    }

    // The log level in effect before the test started.
    LogLevel mLevel;

    // Receives everything the test logs.
    ::testing::StrictMock<MockLogOutput> mOutput;

    // The output in effect before the test started.
    LogOutput* mPrevious;
}; // LoggingTests

TEST_F(LoggingTests, message_reaches_output)
{
    SimpleLogger::setLogLevel(logDebug);

    SubsystemLogger logger("Test");

    EXPECT_CALL(mOutput,
                log(_,
                    logWarning,
                    HasSubstr("logging_tests.cpp:"),
                    EndsWith("disk is 95% full")));

    LogWarningF(logger, "disk is %d%% full", 95);
}

TEST_F(LoggingTests, subsystem_name_prefixes_message)
{
    SimpleLogger::setLogLevel(logDebug);

    SubsystemLogger logger("Bridge");

    EXPECT_CALL(mOutput, log(_, logInfo, _, HasSubstr("Bridge: ")));

    LogInfo1(logger, "started");
}

TEST_F(LoggingTests, masked_messages_are_discarded)
{
    SubsystemLogger logger("Test");

    // StrictMock fails the test if either message is emitted.
    SimpleLogger::setLogLevel(logInfo);

    LogDebug1(logger, "hidden by the global level");

    SimpleLogger::setLogLevel(logMax);
    logger.logLevel(logWarning);

    LogInfoF(logger, "hidden by the %s level", "subsystem");

    EXPECT_TRUE(logger.masked(logInfo));
    EXPECT_FALSE(logger.masked(logWarning));
}

TEST_F(LoggingTests, error_returns_exception)
{
    SimpleLogger::setLogLevel(logDebug);

    SubsystemLogger logger("Test");

    EXPECT_CALL(mOutput, log(_, logError, _, EndsWith("bad handle 7")));

    auto exception = LogErrorF(logger, "bad handle %d", 7);

    EXPECT_STREQ(exception.what(), "bad handle 7");
}

TEST_F(LoggingTests, console_output_format)
{
    std::ostringstream ostream;
    ConsoleLogOutput output(ostream);

    output.log("12:00:00", logWarning, "file.cpp:10", "message");

    EXPECT_EQ(ostream.str(), "[12:00:00][WARNING] message (file.cpp:10)\n");
}

TEST(LogLevelTests, round_trip_names)
{
    EXPECT_EQ(toLogLevel("debug"), logDebug);
    EXPECT_EQ(toLogLevel("WARNING"), logWarning);
    EXPECT_EQ(toLogLevel("bogus"), logInfo);

    EXPECT_STREQ(toString(logError), "ERROR");
    EXPECT_STREQ(toString(logVerbose), "VERBOSE");
}

} // testing
} // aiomega

