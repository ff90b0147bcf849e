/**
 * @file types.cpp
 * @brief Cumulus SDK error descriptions
 *
 * (c) 2026 by the Cumulus SDK authors
 *
 * This file is part of the Cumulus SDK - Client Access Engine.
 *
 * The Cumulus SDK is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * @copyright Simplified (2-clause) BSD License.
 *
 * You should have received a copy of the license along with this
 * program.
 */

#include "cumulus/types.h"

#include <ostream>

namespace cumulus {

const char* errorstring(error e)
{
    switch (e)
    {
        case API_OK:
            return "No error";
        case API_EINTERNAL:
            return "Internal error";
        case API_EARGS:
            return "Invalid argument";
        case API_EAGAIN:
            return "Request failed, retrying";
        case API_ERATELIMIT:
            return "Rate limit exceeded";
        case API_EFAILED:
            return "Failed permanently";
        case API_ETOOMANY:
            return "Too many concurrent connections or transfers";
        case API_ERANGE:
            return "Out of range";
        case API_EEXPIRED:
            return "Expired";
        case API_ENOENT:
            return "Not found";
        case API_EACCESS:
            return "Access denied";
        case API_EEXIST:
            return "Already exists";
        case API_EINCOMPLETE:
            return "Incomplete";
        case API_ETEMPUNAVAIL:
            return "Temporarily not available";
        case API_EREAD:
            return "Read error";
        case LOCAL_ETIMEOUT:
            return "Timeout error";
        case LOCAL_ABANDONED:
            return "Request abandoned";
    }

    return "Unknown error";
}

std::ostream& operator<<(std::ostream& ostr, const Error& e)
{
    ostr << static_cast<int>(error(e)) << " (" << errorstring(e) << ")";

    if (e.hasHttpStatus())
    {
        ostr << " [HTTP " << e.getHttpStatus() << "]";
    }

    return ostr;
}

} // namespace
