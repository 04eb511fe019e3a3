#pragma once

namespace aiomega
{
namespace common
{

class EventLoop;

} // common
} // aiomega

