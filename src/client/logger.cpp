#include <aiomega/client/logger.h>

namespace aiomega
{
namespace client
{

using namespace common;

SubsystemLogger& logger()
{
    static SubsystemLogger logger("Client");

    return logger;
}

} // client
} // aiomega

