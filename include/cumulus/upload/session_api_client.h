#pragma once

#include <cumulus/http/http_transport.h>
#include <cumulus/upload/upload_session_client.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace cumulus
{
namespace common
{

class TaskExecutor;

} // common

namespace upload
{

// Yields the access token sent with each request.
using TokenProvider = std::function<std::string()>;

struct SessionApiClientOptions
{
    // Where the upload session API lives.
    std::string mBaseURL = "https://upload.box.com/api/2.0";

    TokenProvider mTokenProvider;

    // Applied to commits and aborts. Part uploads carry their own timeout.
    std::chrono::milliseconds mRequestTimeout = std::chrono::seconds(60);

    // How many times will we ask whether a commit has been processed?
    unsigned int mMaxCommitPolls = 10;

    // How long do we wait between polls if the service doesn't say?
    std::chrono::seconds mDefaultRetryAfter = std::chrono::seconds(1);

    // Longer delays requested by the service are cut short.
    std::chrono::seconds mMaxRetryAfter = std::chrono::hours(1);
}; // SessionApiClientOptions

// Translate an unsuccessful HTTP status into an error.
Error errorFromStatus(int status);

// How long should we wait before asking about a commit again?
//
// Yields fallback if the response carries no usable Retry-After header
// and never yields more than limit.
std::chrono::seconds retryAfter(const http::HttpResponse& response,
                                std::chrono::seconds fallback,
                                std::chrono::seconds limit);

// Talks to the service's upload session API over HTTP.
//
// Responses and commit polls are delivered on the transport's and the
// executor's threads and reference the client. A client must therefore
// outlive every request it has issued: stop the executor and the
// transport before destroying it.
class SessionApiClient
  : public UploadSessionClient
{
    // Tracks a commit the service is still processing.
    struct CommitContext;

    using CommitContextPtr = std::shared_ptr<CommitContext>;

    // Populate headers common to every request.
    http::HttpRequest request(http::HttpMethod method,
                              const std::string& url) const;

    // Send a commit request.
    void sendCommit(CommitContextPtr context);

    // Where a session lives.
    std::string sessionURL(const std::string& sessionID) const;

    common::TaskExecutor& mExecutor;

    SessionApiClientOptions mOptions;

    http::HttpTransport& mTransport;

public:
    SessionApiClient(http::HttpTransport& transport,
                     common::TaskExecutor& executor,
                     SessionApiClientOptions options);

    void abort(const std::string& sessionID,
               AbortCallback callback) override;

    void commit(const std::string& sessionID,
                const std::string& digest,
                const CommitRequest& request,
                CommitCallback callback) override;

    void uploadPart(const std::string& sessionID,
                    const PartUpload& part,
                    PartUploadCallback callback) override;
}; // SessionApiClient

} // upload
} // cumulus
