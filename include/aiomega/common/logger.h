#pragma once

#include <stdexcept>
#include <string>

#include <aiomega/common/log_level_forward.h>
#include <aiomega/common/logger_forward.h>

namespace aiomega
{
namespace common
{

// Tags messages with the thread and subsystem that emitted them before
// handing them to SimpleLogger.
class Logger
{
    // Prepended to every message we emit.
    std::string mPrefix;

public:
    explicit Logger(const char* subsystemName = nullptr);

    Logger(const Logger& other) = delete;

    virtual ~Logger() = default;

    Logger& operator=(const Logger& rhs) = delete;

    // Emit message at error level and return an exception describing it.
    std::runtime_error error(const char* filename,
                             unsigned int line,
                             std::string message) const;

    // Emit message at the specified level.
    void emit(LogLevel level,
              const char* filename,
              unsigned int line,
              const std::string& message) const;

    // Would a message at this level be discarded?
    virtual bool masked(LogLevel level) const;
}; // Logger

// The logger used by code that doesn't belong to any subsystem.
Logger& logger();

} // common
} // aiomega

