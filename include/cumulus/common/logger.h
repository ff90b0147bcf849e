#pragma once

#include <stdexcept>
#include <string>

#include <cumulus/log_level_forward.h>
#include <cumulus/common/logger_forward.h>

namespace cumulus
{
namespace common
{

// Forwards messages to SimpleLogger, tagged with a subsystem name.
//
// Use the macros in logging.h rather than calling these members
// directly so that messages carry their origin.
class Logger
{
    // Tags and forwards message to SimpleLogger.
    void emit(const char* filename,
              const std::string& message,
              unsigned int line,
              int severity) const;

    // Empty if this is the default logger.
    const std::string mPrefix;

public:
    explicit Logger(const char* subsystemName = nullptr);

    Logger(const Logger& other) = delete;

    virtual ~Logger() = default;

    Logger& operator=(const Logger& rhs) = delete;

    // Logs an error and returns an exception describing it.
    std::runtime_error error(const char* filename,
                             const char* format,
                             unsigned int line,
                             ...) const;

    void log(const char* filename,
             const std::string& message,
             unsigned int line,
             int severity) const;

    // printf-style.
    void log(const char* filename,
             const char* format,
             unsigned int line,
             int severity,
             ...) const;

    // True if messages of this severity would be discarded.
    virtual bool masked(int severity) const;
}; // Logger

// The logger used by code with no subsystem of its own.
Logger& logger();

} // common
} // cumulus
