#pragma once

#include <atomic>

#include <aiomega/common/log_level.h>
#include <aiomega/common/logger.h>

namespace aiomega
{
namespace common
{

// A logger whose verbosity can be tuned independently of SimpleLogger.
//
// A message is emitted only when neither level masks it.
class SubsystemLogger
  : public Logger
{
    std::atomic<LogLevel> mLogLevel;

public:
    explicit SubsystemLogger(const char* name);

    void logLevel(LogLevel level);

    LogLevel logLevel() const;

    bool masked(LogLevel level) const override;
}; // SubsystemLogger

} // common
} // aiomega

