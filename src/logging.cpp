/**
 * @file logging.cpp
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

#include "cumulus/logging.h"

#include <ctime>
#include <iostream>

namespace cumulus {

ExternalLogger g_externalLogger;

std::atomic<Logger*> SimpleLogger::logger{&g_externalLogger};

// info and more severe messages are emitted unless told otherwise
std::atomic<LogLevel> SimpleLogger::logCurrentLevel{logInfo};

static std::string currentTime()
{
    char buffer[16];
    std::time_t now = std::time(nullptr);
    std::tm tm{};

    gmtime_r(&now, &tm);

    auto length = std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &tm);

    return std::string(buffer, length);
}

SimpleLogger::SimpleLogger(LogLevel ll, const char* filename, int line)
  : level(ll)
{
    source = filename ? filename : "";

    if (line >= 0)
        source += ":" + std::to_string(line);
}

SimpleLogger::~SimpleLogger()
{
    if (Logger* output = logger)
        output->log(currentTime().c_str(), level, source.c_str(), ostr.str().c_str());
}

void ExternalLogger::addLogger(void* id, LogCallback callback)
{
    std::lock_guard<std::recursive_mutex> g(mutex);
    loggers[id] = std::move(callback);
}

void ExternalLogger::removeLogger(void* id)
{
    std::lock_guard<std::recursive_mutex> g(mutex);
    loggers.erase(id);
}

void ExternalLogger::setLogToConsole(bool enable)
{
    std::lock_guard<std::recursive_mutex> g(mutex);
    logToConsole = enable;
}

void ExternalLogger::log(const char *time, int loglevel, const char *source, const char *message)
{
    time = time ? time : "";
    source = source ? source : "";
    message = message ? message : "";

    std::lock_guard<std::recursive_mutex> g(mutex);

    // a callback that logs would recurse into us
    if (dispatching)
        return;

    dispatching = true;

    for (auto& entry : loggers)
        entry.second(time, loglevel, source, message);

    if (logToConsole)
    {
        std::clog << time
                  << " " << toString(static_cast<LogLevel>(loglevel))
                  << " [" << source << "] "
                  << message << std::endl;
    }

    dispatching = false;
}

} // namespace
