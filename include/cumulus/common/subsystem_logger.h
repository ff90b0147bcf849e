#pragma once

#include <atomic>

#include <cumulus/common/logger.h>
#include <cumulus/log_level.h>

namespace cumulus
{
namespace common
{

// A logger whose verbosity can be tuned independently of SimpleLogger's.
//
// A message is emitted only if neither level masks it.
class SubsystemLogger
  : public Logger
{
    std::atomic<LogLevel> mLogLevel;

public:
    explicit SubsystemLogger(const char* name, LogLevel level = logInfo);

    void logLevel(LogLevel level);

    LogLevel logLevel() const;

    bool masked(int severity) const override;
}; // SubsystemLogger

} // common
} // cumulus
