#pragma once

namespace aiomega
{
namespace common
{

class LogOutput;
class Logger;
class SimpleLogger;
class SubsystemLogger;

} // common
} // aiomega

