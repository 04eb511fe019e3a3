#pragma once

namespace aiomega
{
namespace common
{

enum LogLevel : int;

} // common
} // aiomega

