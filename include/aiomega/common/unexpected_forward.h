#pragma once

namespace aiomega
{
namespace common
{

template<typename E>
class Unexpected;

} // common
} // aiomega

