#pragma once

namespace aiomega
{
namespace bridge
{

struct TransferProgress;

} // bridge
} // aiomega

