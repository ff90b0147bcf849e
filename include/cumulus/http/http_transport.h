#pragma once

#include <cumulus/http/http_request.h>

namespace cumulus
{
namespace http
{

// Something that can issue HTTP requests.
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    // Issue request and invoke callback once it has completed.
    //
    // The callback may be invoked on any thread.
    virtual void send(HttpRequest request, HttpCallback callback) = 0;
}; // HttpTransport

} // http
} // cumulus
