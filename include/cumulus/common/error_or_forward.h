#pragma once

#include <cumulus/common/expected_forward.h>

namespace cumulus
{

class Error;

namespace common
{

template<typename T>
using ErrorOr = Expected<Error, T>;

} // common
} // cumulus
