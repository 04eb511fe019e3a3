#include <sstream>
#include <thread>
#include <utility>

#include <aiomega/common/log_level.h>
#include <aiomega/common/logger.h>
#include <aiomega/common/simple_logger.h>

namespace aiomega
{
namespace common
{

Logger::Logger(const char* subsystemName)
  : mPrefix()
{
    if (subsystemName)
        mPrefix = std::string(subsystemName) + ": ";
}

std::runtime_error Logger::error(const char* filename,
                                 unsigned int line,
                                 std::string message) const
{
    emit(logError, filename, line, message);

    return std::runtime_error(std::move(message));
}

void Logger::emit(LogLevel level,
                  const char* filename,
                  unsigned int line,
                  const std::string& message) const
{
    if (masked(level))
        return;

    std::ostringstream ostream;

    // Engine threads and the loop's thread log concurrently.
    ostream << std::this_thread::get_id()
            << " "
            << mPrefix
            << message;

    SimpleLogger::postLog(level,
                          ostream.str().c_str(),
                          filename ? filename : "",
                          static_cast<int>(line));
}

bool Logger::masked(LogLevel level) const
{
    return SimpleLogger::getLogLevel() < level;
}

Logger& logger()
{
    static Logger instance;

    return instance;
}

} // common
} // aiomega

