#pragma once

#include <optional>
#include <string>

#include <cumulus/log_level_forward.h>

namespace cumulus
{

// Most severe first.
#define CUMULUS_LOG_LEVELS(expander) \
    expander(Fatal) \
    expander(Error) \
    expander(Warning) \
    expander(Info) \
    expander(Debug) \
    expander(Verbose)

enum LogLevel : int
{
#define CUMULUS_LOG_LEVEL_ENUMERANT(name) log ## name,
    CUMULUS_LOG_LEVELS(CUMULUS_LOG_LEVEL_ENUMERANT)
#undef CUMULUS_LOG_LEVEL_ENUMERANT
    logMax = logVerbose
}; // LogLevel

// Case insensitive.
std::optional<LogLevel> toLogLevel(const std::string& name);

const char* toString(LogLevel level);

} // cumulus
