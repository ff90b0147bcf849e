#pragma once

#include <chrono>
#include <cstdint>
#include <ratio>

namespace cumulus
{
namespace common
{

using deciseconds = std::chrono::duration<std::int64_t, std::deci>;

} // common
} // cumulus
