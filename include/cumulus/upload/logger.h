#pragma once

#include <cumulus/common/subsystem_logger.h>

namespace cumulus
{
namespace upload
{

// The logger used by the upload engine.
common::SubsystemLogger& logger();

} // upload
} // cumulus
