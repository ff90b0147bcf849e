#pragma once

#include <cumulus/upload/file_resource.h>
#include <cumulus/upload/upload_part.h>
#include <cumulus/types.h>

#include <cstddef>
#include <string>
#include <variant>

namespace cumulus
{
namespace upload
{

// A part has been accepted by the service.
struct PartUploaded
{
    CompletedPart mPart;

    // How many parts have been accepted so far?
    std::size_t mCompleted;

    // How many parts are there in total?
    std::size_t mTotal;
}; // PartUploaded

// A part couldn't be uploaded.
//
// The upload as a whole continues, the caller can call start() to try
// the failed parts again or abort() to give up.
struct PartFailed
{
    PendingPart mPart;
    Error mError;
    unsigned int mAttempts;
}; // PartFailed

// The session has been committed.
struct UploadCompleted
{
    FileResource mFile;
}; // UploadCompleted

// The commit failed.
struct UploadFailed
{
    Error mError;

    // The session can still be committed or aborted.
    std::string mSessionID;
}; // UploadFailed

// The session has been deleted.
struct UploadAborted
{
}; // UploadAborted

// The session couldn't be deleted.
struct AbortFailed
{
    Error mError;
}; // AbortFailed

using UploadEvent = std::variant<PartUploaded,
                                 PartFailed,
                                 UploadCompleted,
                                 UploadFailed,
                                 UploadAborted,
                                 AbortFailed>;

// Is this the last event an upload will emit?
bool terminal(const UploadEvent& event);

const char* toString(const UploadEvent& event);

} // upload
} // cumulus
