#pragma once

#include <cumulus/http/http_transport.h>

#include <string>

namespace cumulus
{
namespace common
{

class TaskExecutor;

} // common

namespace http
{

// Issues requests with libcurl.
//
// Each request is performed synchronously on one of the executor's
// workers so callbacks are always invoked on a worker thread.
class CurlHttpTransport
  : public HttpTransport
{
    // Perform request on the calling thread.
    static common::ErrorOr<HttpResponse> perform(const HttpRequest& request,
                                                 const std::string& userAgent);

    common::TaskExecutor& mExecutor;

    // Sent as User-Agent unless empty.
    std::string mUserAgent;

public:
    CurlHttpTransport(common::TaskExecutor& executor,
                      std::string userAgent = std::string());

    ~CurlHttpTransport();

    void send(HttpRequest request, HttpCallback callback) override;
}; // CurlHttpTransport

} // http
} // cumulus
