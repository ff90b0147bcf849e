#pragma once

#include <cumulus/common/error_or_forward.h>
#include <cumulus/common/expected.h>
#include <cumulus/types.h>
