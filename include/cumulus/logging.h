/**
 * @file cumulus/logging.h
 * @brief Logging class
 *
 * (c) 2026 by the Cumulus SDK authors
 *
 * This file is part of the Cumulus SDK - Client Access Engine.
 *
 * The Cumulus SDK is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * @copyright Simplified (2-clause) BSD License.
 *
 * You should have received a copy of the license along with this
 * program.
 */

/* Usage example:

    // output everything up to debug level on the console
    SimpleLogger::setLogLevel(logDebug);
    g_externalLogger.setLogToConsole(true);

    LOG_debug << "test";
    LOG_info << "informing";

    // forward logs to the application
    g_externalLogger.addLogger(this, [](const char* time, int loglevel, const char* source, const char* message) {
        ...
    });
*/
#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <type_traits>

#include <cumulus/log_level.h>

namespace cumulus {

// Receives each completed log line.
class Logger
{
public:
    virtual ~Logger() = default;
    virtual void log(const char *time, int loglevel, const char *source, const char *message) = 0;
};

// Accumulates a single log line and hands it to the output class when
// destroyed.
class SimpleLogger
{
    const LogLevel level;

    // "file:line" of whoever's logging.
    std::string source;

    std::ostringstream ostr;

    static std::atomic<Logger*> logger;

    static std::atomic<LogLevel> logCurrentLevel;

public:
    SimpleLogger(LogLevel ll, const char* filename, int line);

    SimpleLogger(const SimpleLogger&) = delete;

    ~SimpleLogger();

    SimpleLogger& operator=(const SimpleLogger&) = delete;

    SimpleLogger& operator<<(const char* str)
    {
        ostr << (str ? str : "(NULL)");
        return *this;
    }

    template <typename T, typename = std::enable_if_t<!std::is_pointer<T>::value>>
    SimpleLogger& operator<<(const T& obj)
    {
        ostr << obj;
        return *this;
    }

    // where completed lines are sent
    static void setOutputClass(Logger *logger_class)
    {
        logger = logger_class;
    }

    // messages more verbose than ll are discarded
    static void setLogLevel(LogLevel ll)
    {
        logCurrentLevel = ll;
    }

    static LogLevel getLogLevel()
    {
        return logCurrentLevel;
    }

    // Emit an already formatted message.
    static void postLog(LogLevel logLevel, const char *message, const char *filename, int line)
    {
        if (logCurrentLevel < logLevel) return;
        SimpleLogger(logLevel, filename ? filename : "", line) << message;
    }
};

// Strips any directories from __FILE__.
template<std::size_t N> inline const char* log_file_leafname(const char (&fullpath)[N])
{
    const char* leaf = fullpath;

    for (std::size_t i = 0; i + 1 < N; ++i)
    {
        if (fullpath[i] == '/' || fullpath[i] == '\\')
            leaf = &fullpath[i + 1];
    }

    return leaf;
}

// Lets the LOG_ macros below be used as a single expression.
struct LoggerVoidify
{
    void operator&(SimpleLogger&) {}
};

#define CUMULUS_LOG_AT(ll) \
    ::cumulus::SimpleLogger::getLogLevel() < (ll) ? (void)0 : \
        ::cumulus::LoggerVoidify() & ::cumulus::SimpleLogger((ll), ::cumulus::log_file_leafname(__FILE__), __LINE__)

#define LOG_verbose CUMULUS_LOG_AT(::cumulus::logVerbose)
#define LOG_debug CUMULUS_LOG_AT(::cumulus::logDebug)
#define LOG_info CUMULUS_LOG_AT(::cumulus::logInfo)
#define LOG_warn CUMULUS_LOG_AT(::cumulus::logWarning)
#define LOG_err CUMULUS_LOG_AT(::cumulus::logError)
#define LOG_fatal CUMULUS_LOG_AT(::cumulus::logFatal)

// Fans log lines out to every registered application callback and,
// optionally, to the console.
class ExternalLogger : public Logger
{
public:
    using LogCallback = std::function<void(const char *time, int loglevel, const char *source, const char *message)>;

    void addLogger(void* id, LogCallback callback);
    void removeLogger(void* id);
    void setLogToConsole(bool enable);
    void log(const char *time, int loglevel, const char *source, const char *message) override;

private:
    std::recursive_mutex mutex;
    std::map<void*, LogCallback> loggers;
    bool logToConsole = false;

    // Set while callbacks are running.
    bool dispatching = false;
};

extern ExternalLogger g_externalLogger;

} // namespace
