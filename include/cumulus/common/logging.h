#pragma once

#include <string>

#include <cumulus/log_level.h>
#include <cumulus/common/logger.h>
#include <cumulus/logging.h>

// Where a message came from.
#define CUMULUS_LOG_ORIGIN ::cumulus::log_file_leafname(__FILE__)

// Arguments are only evaluated if the message will be emitted.
#define CUMULUS_LOG_STRING(logger, severity, message) do \
{ \
    if (!(logger).masked((severity))) \
        (logger).log(CUMULUS_LOG_ORIGIN, \
                     std::string(message), \
                     __LINE__, \
                     (severity)); \
} \
while (0)

#define CUMULUS_LOG_FORMAT(logger, severity, format, ...) do \
{ \
    if (!(logger).masked((severity))) \
        (logger).log(CUMULUS_LOG_ORIGIN, \
                     (format), \
                     __LINE__, \
                     (severity), \
                     __VA_ARGS__); \
} \
while (0)

#define LogDebug1(logger, message) \
  CUMULUS_LOG_STRING((logger), ::cumulus::logDebug, (message))

#define LogDebugF(logger, format, ...) \
  CUMULUS_LOG_FORMAT((logger), ::cumulus::logDebug, (format), __VA_ARGS__)

#define LogInfo1(logger, message) \
  CUMULUS_LOG_STRING((logger), ::cumulus::logInfo, (message))

#define LogInfoF(logger, format, ...) \
  CUMULUS_LOG_FORMAT((logger), ::cumulus::logInfo, (format), __VA_ARGS__)

#define LogWarning1(logger, message) \
  CUMULUS_LOG_STRING((logger), ::cumulus::logWarning, (message))

#define LogWarningF(logger, format, ...) \
  CUMULUS_LOG_FORMAT((logger), ::cumulus::logWarning, (format), __VA_ARGS__)

// These evaluate to a std::runtime_error for the caller to throw.
#define LogError1(logger, message) \
  (logger).error(CUMULUS_LOG_ORIGIN, "%s", __LINE__, (message))

#define LogErrorF(logger, format, ...) \
  (logger).error(CUMULUS_LOG_ORIGIN, (format), __LINE__, __VA_ARGS__)
