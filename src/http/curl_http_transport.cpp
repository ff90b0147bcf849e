#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

#include <cumulus/common/logging.h>
#include <cumulus/common/task_executor.h>
#include <cumulus/http/curl_http_transport.h>
#include <cumulus/http/easy_curl.h>
#include <cumulus/http/logger.h>

namespace cumulus
{
namespace http
{

using namespace common;

namespace
{

// Where the response is accumulated.
struct Receiver
{
    HttpResponse mResponse;
}; // Receiver

size_t onBody(char* data, size_t size, size_t count, void* context)
{
    auto& receiver = *static_cast<Receiver*>(context);

    receiver.mResponse.mBody.append(data, size * count);

    return size * count;
}

size_t onHeader(char* data, size_t size, size_t count, void* context)
{
    auto& receiver = *static_cast<Receiver*>(context);
    auto length = size * count;

    std::string line(data, length);

    auto colon = line.find(':');

    // Status lines and the blank line that terminates the headers.
    if (colon == std::string::npos)
    {
        // Headers of an earlier response, such as 100 Continue.
        if (!line.compare(0, 5, "HTTP/"))
            receiver.mResponse.mHeaders.clear();

        return length;
    }

    auto trim = [](std::string value) {
        auto isSpace = [](unsigned char c) { return std::isspace(c); };

        value.erase(value.begin(), std::find_if_not(value.begin(), value.end(), isSpace));
        value.erase(std::find_if_not(value.rbegin(), value.rend(), isSpace).base(), value.end());

        return value;
    }; // trim

    receiver.mResponse.mHeaders[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));

    return length;
}

} // anonymous

ErrorOr<HttpResponse> CurlHttpTransport::perform(const HttpRequest& request,
                                                 const std::string& userAgent)
{
    EasyCurl handle;
    CurlSList headers;
    Receiver receiver;

    auto* curl = handle.curl();

    for (auto& header : request.mHeaders)
        headers.append((header.first + ": " + header.second).c_str());

    // Don't let curl wait for a 100 Continue.
    headers.append("Expect:");

    curl_easy_setopt(curl, CURLOPT_URL, request.mURL.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, onBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &receiver);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, onHeader);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &receiver);

    if (!userAgent.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent.c_str());

    if (request.mTimeout.count() > 0)
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.mTimeout.count()));

    switch (request.mMethod)
    {
    case HM_GET:
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        break;
    case HM_POST:
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        break;
    case HM_DELETE:
    case HM_PUT:
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, toString(request.mMethod));
        break;
    }

    if (request.mBody)
    {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.mBody->data());
        curl_easy_setopt(curl,
                         CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.mBody->size()));
    }

    LogDebugF(logger(),
              "%s %s (%zu bytes)",
              toString(request.mMethod),
              request.mURL.c_str(),
              request.mBody ? request.mBody->size() : static_cast<std::size_t>(0));

    auto result = curl_easy_perform(curl);

    if (result == CURLE_OPERATION_TIMEDOUT)
    {
        LogWarningF(logger(), "%s %s timed out", toString(request.mMethod), request.mURL.c_str());

        return unexpected(LOCAL_ETIMEOUT);
    }

    if (result != CURLE_OK)
    {
        LogWarningF(logger(),
                    "%s %s failed: %s",
                    toString(request.mMethod),
                    request.mURL.c_str(),
                    curl_easy_strerror(result));

        return unexpected(API_EAGAIN);
    }

    long status = 0;

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    receiver.mResponse.mStatus = static_cast<int>(status);

    LogDebugF(logger(),
              "%s %s completed with status %ld",
              toString(request.mMethod),
              request.mURL.c_str(),
              status);

    return std::move(receiver.mResponse);
}

CurlHttpTransport::CurlHttpTransport(TaskExecutor& executor,
                                     std::string userAgent)
  : HttpTransport()
  , mExecutor(executor)
  , mUserAgent(std::move(userAgent))
{
    static std::once_flag initialized;

    std::call_once(initialized, []() {
        auto result = curl_global_init(CURL_GLOBAL_DEFAULT);

        if (result != CURLE_OK)
            throw LogErrorF(logger(),
                            "Couldn't initialize libcurl: %s",
                            curl_easy_strerror(result));
    });
}

CurlHttpTransport::~CurlHttpTransport()
{
}

void CurlHttpTransport::send(HttpRequest request, HttpCallback callback)
{
    auto wrapper = [callback = std::move(callback),
                    request = std::move(request),
                    userAgent = mUserAgent](const Task& task) {
        // Executor's being torn down.
        if (task.cancelled())
            return callback(unexpected(LOCAL_ABANDONED));

        ErrorOr<HttpResponse> result = unexpected(API_EINTERNAL);

        try
        {
            result = CurlHttpTransport::perform(request, userAgent);
        }
        catch (std::exception& exception)
        {
            LogWarningF(logger(),
                        "Couldn't issue %s %s: %s",
                        toString(request.mMethod),
                        request.mURL.c_str(),
                        exception.what());
        }

        callback(std::move(result));
    }; // wrapper

    mExecutor.execute(std::move(wrapper), true);
}

} // http
} // cumulus
