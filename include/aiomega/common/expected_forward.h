#pragma once

namespace aiomega
{
namespace common
{

template<typename E, typename T>
class Expected;

} // common
} // aiomega

