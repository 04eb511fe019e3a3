#pragma once

namespace aiomega
{
namespace common
{

template<typename T = void>
class Task;

} // common
} // aiomega

