#pragma once

#include <gmock/gmock.h>

#include <aiomega/common/simple_logger.h>

namespace aiomega
{
namespace testing
{

class MockLogOutput
  : public common::LogOutput
{
public:
    MOCK_METHOD(void,
                log,
                (const char* time,
                 int loglevel,
                 const char* source,
                 const char* message),
                (override));
}; // MockLogOutput

// Routes SimpleLogger's output to an output for the lifetime of a scope.
class ScopedLogOutput
{
    // The log level in effect before we were constructed.
    common::LogLevel mLevel;

    // The output in effect before we were constructed.
    common::LogOutput* mPrevious;

public:
    ScopedLogOutput(common::LogOutput& output, common::LogLevel level)
      : mLevel(common::SimpleLogger::getLogLevel())
      , mPrevious(common::SimpleLogger::getOutputClass())
    {
        common::SimpleLogger::setOutputClass(&output);
        common::SimpleLogger::setLogLevel(level);
    }

    ScopedLogOutput(const ScopedLogOutput& other) = delete;

    ~ScopedLogOutput()
    {
        common::SimpleLogger::setOutputClass(mPrevious);
        common::SimpleLogger::setLogLevel(mLevel);
    }

    ScopedLogOutput& operator=(const ScopedLogOutput& rhs) = delete;
}; // ScopedLogOutput

} // testing
} // aiomega

