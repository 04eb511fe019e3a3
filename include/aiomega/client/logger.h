#pragma once

#include <aiomega/common/subsystem_logger.h>

namespace aiomega
{
namespace client
{

common::SubsystemLogger& logger();

} // client
} // aiomega

