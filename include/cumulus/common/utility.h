#pragma once

#include <cstdarg>
#include <string>

namespace cumulus
{
namespace common
{

// Render a printf-style format string.
std::string formatv(std::va_list arguments, const char* format);

} // common
} // cumulus
