#pragma once

#include <aiomega/common/simple_logger.h>

namespace aiomega
{
namespace client
{

// Forwards our messages to the SDK's own logging pipeline.
class SdkLogOutput
  : public common::LogOutput
{
public:
    void log(const char* time,
             int loglevel,
             const char* source,
             const char* message) override;
}; // SdkLogOutput

} // client
} // aiomega

