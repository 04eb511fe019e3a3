#include <megaapi.h>

#include <aiomega/client/sdk_log_output.h>

namespace aiomega
{
namespace client
{

void SdkLogOutput::log(const char*,
                       int loglevel,
                       const char* source,
                       const char* message)
{
    // The SDK stamps messages with its own time.
    mega::MegaApi::log(loglevel, message ? message : "", source ? source : "");
}

} // client
} // aiomega

