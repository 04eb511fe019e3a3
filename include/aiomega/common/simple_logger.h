#pragma once

#include <atomic>
#include <mutex>
#include <ostream>
#include <string>

#include <aiomega/common/log_level.h>
#include <aiomega/common/logger_forward.h>

namespace aiomega
{
namespace common
{

// Receives every message that survives the active log level.
class LogOutput
{
public:
    virtual ~LogOutput() = default;

    virtual void log(const char* time,
                     int loglevel,
                     const char* source,
                     const char* message) = 0;
}; // LogOutput

// Writes messages to a standard stream.
class ConsoleLogOutput
  : public LogOutput
{
    // Serializes writes to mStream.
    std::mutex mLock;

    // Where we write our messages.
    std::ostream& mStream;

public:
    explicit ConsoleLogOutput(std::ostream& stream);

    void log(const char* time,
             int loglevel,
             const char* source,
             const char* message) override;
}; // ConsoleLogOutput

class SimpleLogger
{
    // Messages above this level are discarded.
    static std::atomic<LogLevel> mLogLevel;

    // Where messages are sent, if anywhere.
    static std::atomic<LogOutput*> mOutput;

    // Current time in UTC as HH:MM:SS.
    static std::string getTime();

public:
    // The output used when no other has been specified.
    static LogOutput& consoleOutput();

    static LogLevel getLogLevel();

    static void setLogLevel(LogLevel level);

    // Specify where messages should be sent.
    //
    // Passing nullptr silences all output.
    static void setOutputClass(LogOutput* output);

    static LogOutput* getOutputClass();

    // Send a message to the current output.
    static void postLog(LogLevel level,
                        const char* message,
                        const char* filename,
                        int line);
}; // SimpleLogger

// Returns the leaf name of a source file's path.
const char* log_file_leafname(const char* filename);

} // common
} // aiomega

