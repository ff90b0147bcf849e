/**
 * @file cumulus/types.h
 * @brief Cumulus SDK types and includes
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

#ifndef CUMULUS_TYPES_H
#define CUMULUS_TYPES_H 1

#ifdef _MSC_VER
#if CUMULUS_LINKED_AS_SHARED_LIBRARY
 #define CUMULUS_API __declspec(dllimport)
#elif CUMULUS_CREATE_SHARED_LIBRARY
 #define CUMULUS_API __declspec(dllexport)
#endif
#endif

#ifndef CUMULUS_API
 #define CUMULUS_API
#endif

#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

// signed 64-bit generic offset
typedef int64_t m_off_t;

namespace cumulus {

using ::m_off_t;

// within ::cumulus namespace, byte is unsigned char (avoids ambiguity with std::byte)
using byte = unsigned char;

// import these select types into the namespace directly
using std::string;
using std::map;
using std::vector;
using std::unique_ptr;
using std::shared_ptr;
using std::weak_ptr;

// monotonously increasing time in deciseconds
using dstime = int64_t;

#define NEVER (~(dstime)0)

// error codes
typedef enum ErrorCodes : int
{
    API_OK = 0,                     ///< Everything OK.
    API_EINTERNAL = -1,             ///< Internal error.
    API_EARGS = -2,                 ///< Bad arguments.
    API_EAGAIN = -3,                ///< Request failed, retry with exponential backoff.
    API_ERATELIMIT = -4,            ///< Too many requests, slow down.
    API_EFAILED = -5,               ///< Request failed permanently.
    API_ETOOMANY = -6,              ///< Too many requests for this resource.
    API_ERANGE = -7,                ///< Resource access out of range.
    API_EEXPIRED = -8,              ///< Resource expired.
    API_ENOENT = -9,                ///< Resource does not exist.
    API_EACCESS = -11,              ///< Access denied.
    API_EEXIST = -12,               ///< Resource already exists.
    API_EINCOMPLETE = -13,          ///< Request incomplete.
    API_ETEMPUNAVAIL = -18,         ///< Resource temporarily not available.
    API_EREAD = -21,                ///< Source could not be read from (or was shorter than declared)
    LOCAL_ETIMEOUT = -1001,         ///< A request timed out.
    LOCAL_ABANDONED = -1002,        ///< Request abandoned due to local cancellation.
} error;

class Error
{
public:
    Error(error err = API_EINTERNAL)
        : mError(err)
    { }

    Error(error err, int httpStatus)
        : mError(err)
        , mHttpStatus(httpStatus)
    { }

    void setErrorCode(error err)
    {
        mError = err;
    }

    // HTTP status of the response that produced this error, 0 if there was no response.
    void setHttpStatus(int status) { mHttpStatus = status; }
    int getHttpStatus() const { return mHttpStatus; }
    bool hasHttpStatus() const { return mHttpStatus != 0; }

    operator error() const { return mError; }

private:
    error mError = API_EINTERNAL;
    int mHttpStatus = 0;
};

// human readable description of an error code
CUMULUS_API const char* errorstring(error);

std::ostream& operator<<(std::ostream&, const Error&);

} // namespace

#endif
