#pragma once

#include <cstdarg>
#include <string>

namespace aiomega
{
namespace common
{

// Build a string from a printf-style format.
std::string format(const char* format, ...);

std::string formatv(std::va_list arguments, const char* format);

} // common
} // aiomega

