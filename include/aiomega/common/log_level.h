#pragma once

#include <string>

#include <aiomega/common/log_level_forward.h>

namespace aiomega
{
namespace common
{

// Ordered so that they line up with MegaApi::LOG_LEVEL_*.
#define DEFINE_LOG_LEVELS(expander) \
    expander(Fatal) \
    expander(Error) \
    expander(Warning) \
    expander(Info) \
    expander(Debug) \
    expander(Verbose)

enum LogLevel : int
{
#define DEFINE_LOG_LEVEL_ENUMERANT(name) log ## name,
    DEFINE_LOG_LEVELS(DEFINE_LOG_LEVEL_ENUMERANT)
#undef DEFINE_LOG_LEVEL_ENUMERANT
    logMax = logVerbose
}; // LogLevel

LogLevel toLogLevel(const std::string& level);

const char* toString(LogLevel level);

} // common
} // aiomega

