#include <cstring>
#include <ctime>
#include <iostream>

#include <aiomega/common/simple_logger.h>

namespace aiomega
{
namespace common
{

// By default, display messages with a level equal to or less than logInfo.
std::atomic<LogLevel> SimpleLogger::mLogLevel{logInfo};

std::atomic<LogOutput*> SimpleLogger::mOutput{&SimpleLogger::consoleOutput()};

ConsoleLogOutput::ConsoleLogOutput(std::ostream& stream)
  : LogOutput()
  , mLock()
  , mStream(stream)
{
}

void ConsoleLogOutput::log(const char* time,
                           int loglevel,
                           const char* source,
                           const char* message)
{
    if (!time)
        time = "";

    if (!source)
        source = "";

    if (!message)
        message = "";

    std::lock_guard<std::mutex> guard(mLock);

    mStream << "["
            << time
            << "]["
            << toString(static_cast<LogLevel>(loglevel))
            << "] "
            << message;

    if (*source)
        mStream << " (" << source << ")";

    mStream << std::endl;
}

std::string SimpleLogger::getTime()
{
    char ts[50];
    std::time_t t = std::time(nullptr);
    std::tm tm{};

    gmtime_r(&t, &tm);

    if (std::strftime(ts, sizeof(ts), "%H:%M:%S", &tm))
        return ts;

    return {};
}

LogOutput& SimpleLogger::consoleOutput()
{
    static ConsoleLogOutput output(std::clog);

    return output;
}

LogLevel SimpleLogger::getLogLevel()
{
    return mLogLevel;
}

void SimpleLogger::setLogLevel(LogLevel level)
{
    mLogLevel = level;
}

void SimpleLogger::setOutputClass(LogOutput* output)
{
    mOutput = output;
}

LogOutput* SimpleLogger::getOutputClass()
{
    return mOutput;
}

void SimpleLogger::postLog(LogLevel level,
                           const char* message,
                           const char* filename,
                           int line)
{
    if (level > mLogLevel)
        return;

    auto* output = mOutput.load();

    if (!output)
        return;

    auto source = std::string(filename ? filename : "");

    if (!source.empty() && line >= 0)
        source += ":" + std::to_string(line);

    output->log(getTime().c_str(),
                level,
                source.c_str(),
                message);
}

const char* log_file_leafname(const char* filename)
{
    if (!filename)
        return "";

    if (auto* slash = std::strrchr(filename, '/'))
        return slash + 1;

    return filename;
}

} // common
} // aiomega

