#pragma once

#include <cumulus/common/error_or_forward.h>
#include <cumulus/types.h>

#include <cstdint>
#include <string>

namespace cumulus
{
namespace upload
{

// URLs the service advertises for operating on a session.
struct UploadSessionEndpoints
{
    std::string mAbort;
    std::string mCommit;
    std::string mListParts;
    std::string mLogEvent;
    std::string mStatus;
    std::string mUploadPart;
}; // UploadSessionEndpoints

// A server-side upload session, created before the upload begins.
struct UploadSession
{
    // Parses the service's session descriptor.
    static common::ErrorOr<UploadSession> fromJSON(const std::string& json);

    std::string mID;

    // When will the service discard the session? (ISO 8601)
    std::string mExpiresAt;

    // Every part but the last must be exactly this large.
    m_off_t mPartSize = 0;

    UploadSessionEndpoints mEndpoints;

    std::int64_t mTotalParts = 0;
    std::int64_t mPartsProcessed = 0;
}; // UploadSession

} // upload
} // cumulus
