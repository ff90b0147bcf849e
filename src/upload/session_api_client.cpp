#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>

#include <cumulus/base64.h>
#include <cumulus/common/error_or.h>
#include <cumulus/common/logging.h>
#include <cumulus/common/task_executor.h>
#include <cumulus/crypto/cryptopp.h>
#include <cumulus/json.h>
#include <cumulus/upload/logger.h>
#include <cumulus/upload/session_api_client.h>

namespace cumulus
{
namespace upload
{

using namespace common;
using namespace http;

struct SessionApiClient::CommitContext
{
    // The serialized commit request.
    std::shared_ptr<const std::string> mBody;

    CommitCallback mCallback;

    std::string mDigest;

    // How many times have we been told to come back later?
    unsigned int mPolls = 0u;

    std::string mSessionID;
}; // CommitContext

// Parse the body of a successful part upload.
static ErrorOr<CompletedPart> parsePart(const HttpResponse& response)
{
    auto stripped = JSON::stripWhitespace(response.mBody);
    JSON reader(stripped);

    if (!reader.enterobject())
        return unexpected(Error(API_EINTERNAL, response.mStatus));

    for (auto name = reader.getname(); !name.empty(); name = reader.getname())
    {
        if (name != "part")
        {
            if (!reader.storeobject())
                break;

            continue;
        }

        if (!reader.enterobject())
            break;

        auto part = CompletedPart::fromJSON(reader);

        if (!part)
            break;

        return part;
    }

    LogWarningF(logger(), "Malformed part upload response: %s", stripped.c_str());

    return unexpected(Error(API_EINTERNAL, response.mStatus));
}

// Parse the body of a successful commit.
static ErrorOr<FileResource> parseCommit(const HttpResponse& response)
{
    auto stripped = JSON::stripWhitespace(response.mBody);
    JSON reader(stripped);

    if (!reader.enterobject())
        return unexpected(Error(API_EINTERNAL, response.mStatus));

    for (auto name = reader.getname(); !name.empty(); name = reader.getname())
    {
        if (name != "entries")
        {
            if (!reader.storeobject())
                break;

            continue;
        }

        // The first entry describes the new file.
        if (!reader.enterarray() || !reader.enterobject())
            break;

        auto file = FileResource::fromJSON(reader);

        if (!file)
            break;

        return file;
    }

    LogWarningF(logger(), "Malformed commit response: %s", stripped.c_str());

    return unexpected(Error(API_EINTERNAL, response.mStatus));
}

std::chrono::seconds retryAfter(const HttpResponse& response,
                                std::chrono::seconds fallback,
                                std::chrono::seconds limit)
{
    auto value = response.header("Retry-After");

    if (value.empty())
        return fallback;

    char* end = nullptr;

    errno = 0;

    auto seconds = std::strtoll(value.c_str(), &end, 10);

    // Dates aren't supported.
    if (end == value.c_str() || *end || seconds < 0)
        return fallback;

    if (errno == ERANGE || seconds > limit.count())
        return limit;

    return std::chrono::seconds(seconds);
}

Error errorFromStatus(int status)
{
    switch (status)
    {
    case 401:
    case 403:
        return Error(API_EACCESS, status);
    case 404:
        return Error(API_ENOENT, status);
    case 409:
        return Error(API_EEXIST, status);
    case 412:
        return Error(API_EEXPIRED, status);
    case 416:
        return Error(API_ERANGE, status);
    case 429:
        return Error(API_ERATELIMIT, status);
    default:
        break;
    }

    if (status >= 500)
        return Error(API_ETEMPUNAVAIL, status);

    return Error(API_EFAILED, status);
}

HttpRequest SessionApiClient::request(HttpMethod method,
                                      const std::string& url) const
{
    HttpRequest request;

    request.mMethod = method;
    request.mTimeout = mOptions.mRequestTimeout;
    request.mURL = url;

    if (mOptions.mTokenProvider)
        request.mHeaders["Authorization"] = "Bearer " + mOptions.mTokenProvider();

    return request;
}

void SessionApiClient::sendCommit(CommitContextPtr context)
{
    auto request = this->request(HM_POST, sessionURL(context->mSessionID) + "/commit");

    request.mBody = context->mBody;
    request.mHeaders["Content-Type"] = "application/json";
    request.mHeaders["Digest"] = "sha=" + context->mDigest;

    mTransport.send(std::move(request), [context, this](ErrorOr<HttpResponse> result) {
        if (!result)
            return context->mCallback(unexpected(result.error()));

        auto& response = *result;

        if (response.mStatus == 201)
            return context->mCallback(parseCommit(response));

        if (response.mStatus != 202)
        {
            LogWarningF(logger(),
                        "Commit of session %s failed with status %d: %s",
                        context->mSessionID.c_str(),
                        response.mStatus,
                        response.mBody.c_str());

            return context->mCallback(unexpected(errorFromStatus(response.mStatus)));
        }

        // Service is still processing the parts.
        if (++context->mPolls > mOptions.mMaxCommitPolls)
        {
            LogWarningF(logger(),
                        "Gave up waiting for session %s to be committed",
                        context->mSessionID.c_str());

            return context->mCallback(unexpected(Error(API_EINCOMPLETE, response.mStatus)));
        }

        auto delay = retryAfter(response,
                                mOptions.mDefaultRetryAfter,
                                mOptions.mMaxRetryAfter);

        LogDebugF(logger(),
                  "Session %s is being processed, asking again in %lld second(s)",
                  context->mSessionID.c_str(),
                  static_cast<long long>(delay.count()));

        mExecutor.execute([context, this](const Task& task) {
            if (task.cancelled())
                return context->mCallback(unexpected(LOCAL_ABANDONED));

            sendCommit(context);
        }, delay, true);
    });
}

std::string SessionApiClient::sessionURL(const std::string& sessionID) const
{
    return mOptions.mBaseURL + "/files/upload_sessions/" + sessionID;
}

SessionApiClient::SessionApiClient(HttpTransport& transport,
                                   TaskExecutor& executor,
                                   SessionApiClientOptions options)
  : UploadSessionClient()
  , mExecutor(executor)
  , mOptions(std::move(options))
  , mTransport(transport)
{
}

void SessionApiClient::abort(const std::string& sessionID,
                             AbortCallback callback)
{
    auto request = this->request(HM_DELETE, sessionURL(sessionID));

    mTransport.send(std::move(request),
                    [callback = std::move(callback), sessionID](ErrorOr<HttpResponse> result) {
                        if (!result)
                            return callback(result.error());

                        if (result->successful())
                            return callback(API_OK);

                        LogWarningF(logger(),
                                    "Abort of session %s failed with status %d",
                                    sessionID.c_str(),
                                    result->mStatus);

                        callback(errorFromStatus(result->mStatus));
                    });
}

void SessionApiClient::commit(const std::string& sessionID,
                              const std::string& digest,
                              const CommitRequest& request,
                              CommitCallback callback)
{
    JSONWriter writer;

    writer.beginobject();
    writer.beginarray("parts");

    for (auto& part : request.mParts)
        part.toJSON(writer);

    writer.endarray();
    writer.beginobject("attributes");

    for (auto& attribute : request.mAttributes)
        writer.arg_stringWithEscapes(attribute.first.c_str(), attribute.second);

    writer.endobject();
    writer.endobject();

    auto context = std::make_shared<CommitContext>();

    context->mBody = std::make_shared<const std::string>(writer.getstring());
    context->mCallback = std::move(callback);
    context->mDigest = digest;
    context->mSessionID = sessionID;

    sendCommit(std::move(context));
}

void SessionApiClient::uploadPart(const std::string& sessionID,
                                  const PartUpload& part,
                                  PartUploadCallback callback)
{
    // Sanity.
    if (!part.mData || part.mData->empty())
        return callback(unexpected(API_EARGS));

    auto last = part.mOffset + static_cast<m_off_t>(part.mData->size()) - 1;
    auto request = this->request(HM_PUT, sessionURL(sessionID));

    char range[96];

    std::snprintf(range,
                  sizeof(range),
                  "bytes %" PRId64 "-%" PRId64 "/%" PRId64,
                  static_cast<std::int64_t>(part.mOffset),
                  static_cast<std::int64_t>(last),
                  static_cast<std::int64_t>(part.mTotalSize));

    request.mBody = part.mData;
    request.mHeaders["Content-Range"] = range;
    request.mHeaders["Content-Type"] = "application/octet-stream";
    request.mHeaders["Digest"] = "sha=" + Base64::btoa(HashSHA1::digest(*part.mData));
    request.mTimeout = part.mTimeout;

    mTransport.send(std::move(request),
                    [callback = std::move(callback)](ErrorOr<HttpResponse> result) {
                        if (!result)
                            return callback(unexpected(result.error()));

                        if (result->mStatus == 200 || result->mStatus == 201)
                            return callback(parsePart(*result));

                        callback(unexpected(errorFromStatus(result->mStatus)));
                    });
}

} // upload
} // cumulus
