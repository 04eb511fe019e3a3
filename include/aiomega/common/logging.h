#pragma once

#include <string>

#include <aiomega/common/log_level.h>
#include <aiomega/common/logger.h>
#include <aiomega/common/simple_logger.h>
#include <aiomega/common/utility.h>

// Emit a preformatted message.
#define AIOMEGA_LOG1(logger, level, message) do \
{ \
    if (!(logger).masked((level))) \
        (logger).emit((level), \
                      ::aiomega::common::log_file_leafname(__FILE__), \
                      __LINE__, \
                      std::string(message)); \
} \
while (0)

// Emit a printf-style message.
#define AIOMEGA_LOGF(logger, level, pattern, ...) do \
{ \
    if (!(logger).masked((level))) \
        (logger).emit((level), \
                      ::aiomega::common::log_file_leafname(__FILE__), \
                      __LINE__, \
                      ::aiomega::common::format((pattern), __VA_ARGS__)); \
} \
while (0)

#define LogDebug1(logger, message) \
  AIOMEGA_LOG1((logger), ::aiomega::common::logDebug, (message))

#define LogDebugF(logger, pattern, ...) \
  AIOMEGA_LOGF((logger), ::aiomega::common::logDebug, (pattern), __VA_ARGS__)

#define LogInfo1(logger, message) \
  AIOMEGA_LOG1((logger), ::aiomega::common::logInfo, (message))

#define LogInfoF(logger, pattern, ...) \
  AIOMEGA_LOGF((logger), ::aiomega::common::logInfo, (pattern), __VA_ARGS__)

#define LogWarning1(logger, message) \
  AIOMEGA_LOG1((logger), ::aiomega::common::logWarning, (message))

#define LogWarningF(logger, pattern, ...) \
  AIOMEGA_LOGF((logger), ::aiomega::common::logWarning, (pattern), __VA_ARGS__)

// Errors are always emitted and yield an exception the caller can throw.
#define LogError1(logger, message) \
  (logger).error(::aiomega::common::log_file_leafname(__FILE__), \
                 __LINE__, \
                 std::string(message))

#define LogErrorF(logger, pattern, ...) \
  (logger).error(::aiomega::common::log_file_leafname(__FILE__), \
                 __LINE__, \
                 ::aiomega::common::format((pattern), __VA_ARGS__))

