#include <aiomega/bridge/logger.h>

namespace aiomega
{
namespace bridge
{

using namespace common;

SubsystemLogger& logger()
{
    static SubsystemLogger logger("Bridge");

    return logger;
}

} // bridge
} // aiomega

