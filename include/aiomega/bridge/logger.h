#pragma once

#include <aiomega/common/subsystem_logger.h>

namespace aiomega
{
namespace bridge
{

common::SubsystemLogger& logger();

} // bridge
} // aiomega

