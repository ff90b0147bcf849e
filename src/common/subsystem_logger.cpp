#include <cumulus/common/subsystem_logger.h>
#include <cumulus/logging.h>

namespace cumulus
{
namespace common
{

SubsystemLogger::SubsystemLogger(const char* name, LogLevel level)
  : Logger(name)
  , mLogLevel(level)
{
}

void SubsystemLogger::logLevel(LogLevel level)
{
    mLogLevel.store(level);
}

LogLevel SubsystemLogger::logLevel() const
{
    return mLogLevel.load();
}

bool SubsystemLogger::masked(int severity) const
{
    return severity > mLogLevel.load()
           || severity > SimpleLogger::getLogLevel();
}

} // common
} // cumulus
