#pragma once

#include <aiomega/common/expected_forward.h>

namespace aiomega
{
namespace common
{

class Error;

enum ErrorKind : unsigned int;

template<typename T>
using ErrorOr = Expected<Error, T>;

} // common
} // aiomega

