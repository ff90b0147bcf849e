#pragma once

#include <cumulus/common/error_or.h>
#include <cumulus/types.h>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace cumulus
{
namespace http
{

enum HttpMethod : unsigned int
{
    HM_DELETE,
    HM_GET,
    HM_POST,
    HM_PUT
}; // HttpMethod

const char* toString(HttpMethod method);

// Header names are compared case-insensitively.
struct HeaderNameLess
{
    bool operator()(const std::string& lhs, const std::string& rhs) const;
}; // HeaderNameLess

using HttpHeaders = std::map<std::string, std::string, HeaderNameLess>;

struct HttpRequest
{
    HttpMethod mMethod = HM_GET;

    std::string mURL;

    HttpHeaders mHeaders;

    // May be null if the request has no body.
    std::shared_ptr<const std::string> mBody;

    // Zero means no timeout.
    std::chrono::milliseconds mTimeout = std::chrono::milliseconds(0);
}; // HttpRequest

struct HttpResponse
{
    // Retrieve a header's value, empty if the header wasn't sent.
    std::string header(const std::string& name) const;

    // Is the status in the 2xx range?
    bool successful() const;

    int mStatus = 0;

    HttpHeaders mHeaders;

    std::string mBody;
}; // HttpResponse

// Transport failures are reported as errors, any response the
// server sent, whatever its status, as a value.
using HttpCallback = std::function<void(common::ErrorOr<HttpResponse>)>;

} // http
} // cumulus
