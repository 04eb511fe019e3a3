#include <algorithm>
#include <cctype>
#include <map>

#include <aiomega/common/log_level.h>

namespace aiomega
{
namespace common
{

static std::string toUpper(std::string value)
{
    std::transform(value.begin(),
                   value.end(),
                   value.begin(),
                   [](unsigned char c) {
                       return static_cast<char>(std::toupper(c));
                   });

    return value;
}

LogLevel toLogLevel(const std::string& level)
{
    static const std::map<std::string, LogLevel> levels = {
#define DEFINE_LOG_LEVEL_ENTRY(name) \
    {toUpper(#name), log ## name},
        DEFINE_LOG_LEVELS(DEFINE_LOG_LEVEL_ENTRY)
#undef DEFINE_LOG_LEVEL_ENTRY
    }; // levels

    auto i = levels.find(toUpper(level));

    if (i != levels.end())
        return i->second;

    // Assume some sane default.
    return logInfo;
}

const char* toString(LogLevel level)
{
    static const std::map<LogLevel, std::string> strings = {
#define DEFINE_LOG_LEVEL_ENTRY(name) \
    {log ## name, toUpper(#name)},
        DEFINE_LOG_LEVELS(DEFINE_LOG_LEVEL_ENTRY)
#undef DEFINE_LOG_LEVEL_ENTRY
    }; // strings

    if (auto i = strings.find(level); i != strings.end())
        return i->second.c_str();

    return "N/A";
}

} // common
} // aiomega

