#pragma once

namespace aiomega
{
namespace bridge
{

class ProgressCallback;

} // bridge
} // aiomega

