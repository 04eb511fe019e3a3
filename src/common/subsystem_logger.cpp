#include <aiomega/common/simple_logger.h>
#include <aiomega/common/subsystem_logger.h>

namespace aiomega
{
namespace common
{

SubsystemLogger::SubsystemLogger(const char* name)
  : Logger(name)
  , mLogLevel(logMax)
{
}

void SubsystemLogger::logLevel(LogLevel level)
{
    mLogLevel.store(level);
}

LogLevel SubsystemLogger::logLevel() const
{
    return mLogLevel.load();
}

bool SubsystemLogger::masked(LogLevel level) const
{
    if (mLogLevel.load() < level)
        return true;

    return Logger::masked(level);
}

} // common
} // aiomega

