#include <array>
#include <cstdio>

#include <aiomega/common/utility.h>

namespace aiomega
{
namespace common
{

std::string format(const char* format, ...)
{
    std::va_list arguments;

    va_start(arguments, format);

    auto result = formatv(arguments, format);

    va_end(arguments);

    return result;
}

std::string formatv(std::va_list arguments, const char* format)
{
    if (!format)
        return std::string();

    // Most messages fit comfortably on the stack.
    std::array<char, 256> buffer;
    std::va_list copy;

    va_copy(copy, arguments);

    auto length = std::vsnprintf(buffer.data(), buffer.size(), format, copy);

    va_end(copy);

    // Malformed format.
    if (length < 0)
        return std::string(format);

    auto size = static_cast<std::size_t>(length);

    if (size < buffer.size())
        return std::string(buffer.data(), size);

    std::string result(size, '\0');

    va_copy(copy, arguments);

    // result.data()[size] is the string's own terminator.
    std::vsnprintf(result.data(), size + 1, format, copy);

    va_end(copy);

    return result;
}

} // common
} // aiomega

