#include <cassert>
#include <cstdio>

#include <cumulus/common/utility.h>

namespace cumulus
{
namespace common
{

std::string formatv(std::va_list arguments, const char* format)
{
    assert(format);

    char small[256];
    std::va_list copy;

    va_copy(copy, arguments);
    auto length = std::vsnprintf(small, sizeof(small), format, copy);
    va_end(copy);

    if (length < 0)
        return std::string();

    auto size = static_cast<std::size_t>(length);

    if (size < sizeof(small))
        return std::string(small, size);

    // Didn't fit: format again into a buffer that's large enough.
    std::string result(size, '\0');

    va_copy(copy, arguments);
    std::vsnprintf(result.data(), size + 1, format, copy);
    va_end(copy);

    return result;
}

} // common
} // cumulus
