#pragma once

#include <cumulus/common/subsystem_logger.h>

namespace cumulus
{
namespace http
{

common::SubsystemLogger& logger();

} // http
} // cumulus
