#include <cassert>
#include <cstdarg>
#include <sstream>
#include <thread>

#include <cumulus/log_level.h>
#include <cumulus/common/logger.h>
#include <cumulus/common/utility.h>

#include <cumulus/logging.h>

namespace cumulus
{
namespace common
{

static std::string prefix(const char* subsystemName)
{
    if (!subsystemName || !*subsystemName)
        return std::string();

    return std::string("[") + subsystemName + "] ";
}

void Logger::emit(const char* filename,
                  const std::string& message,
                  unsigned int line,
                  int severity) const
{
    assert(filename);

    std::ostringstream ostream;

    ostream << mPrefix
            << std::this_thread::get_id()
            << ": "
            << message;

    SimpleLogger::postLog(static_cast<LogLevel>(severity),
                          ostream.str().c_str(),
                          filename,
                          static_cast<int>(line));
}

Logger::Logger(const char* subsystemName)
  : mPrefix(prefix(subsystemName))
{
}

std::runtime_error Logger::error(const char* filename,
                                 const char* format,
                                 unsigned int line,
                                 ...) const
{
    std::va_list arguments;

    va_start(arguments, line);

    auto message = formatv(arguments, format);

    va_end(arguments);

    if (!masked(logError))
        emit(filename, message, line, logError);

    return std::runtime_error(message);
}

void Logger::log(const char* filename,
                 const std::string& message,
                 unsigned int line,
                 int severity) const
{
    assert(severity <= logMax);

    if (!masked(severity))
        emit(filename, message, line, severity);
}

void Logger::log(const char* filename,
                 const char* format,
                 unsigned int line,
                 int severity,
                 ...) const
{
    assert(format);
    assert(severity <= logMax);

    // Don't bother formatting what no one will see.
    if (masked(severity))
        return;

    std::va_list arguments;

    va_start(arguments, severity);

    auto message = formatv(arguments, format);

    va_end(arguments);

    emit(filename, message, line, severity);
}

bool Logger::masked(int severity) const
{
    return SimpleLogger::getLogLevel() < severity;
}

Logger& logger()
{
    static Logger logger;

    return logger;
}

} // common
} // cumulus
