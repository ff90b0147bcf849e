#include <strings.h>

#include <cumulus/log_level.h>

namespace cumulus
{

std::optional<LogLevel> toLogLevel(const std::string& name)
{
#define CUMULUS_LOG_LEVEL_MATCH(level) \
    if (!strcasecmp(name.c_str(), #level)) \
        return log ## level;

    CUMULUS_LOG_LEVELS(CUMULUS_LOG_LEVEL_MATCH)

#undef CUMULUS_LOG_LEVEL_MATCH

    return std::nullopt;
}

const char* toString(LogLevel level)
{
    switch (level)
    {
#define CUMULUS_LOG_LEVEL_CASE(name) \
    case log ## name: \
        return #name;

        CUMULUS_LOG_LEVELS(CUMULUS_LOG_LEVEL_CASE)

#undef CUMULUS_LOG_LEVEL_CASE
    }

    return "Unknown";
}

} // cumulus
