#pragma once

#include <cumulus/common/error_or.h>
#include <cumulus/upload/file_resource.h>
#include <cumulus/upload/upload_part.h>
#include <cumulus/types.h>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace cumulus
{
namespace upload
{

// Describes a single part upload.
struct PartUpload
{
    // The part's content.
    std::shared_ptr<const std::string> mData;

    // Where the part begins in the file.
    m_off_t mOffset = 0;

    // How large is the file as a whole?
    m_off_t mTotalSize = 0;

    // Zero means no timeout.
    std::chrono::milliseconds mTimeout = std::chrono::milliseconds(0);
}; // PartUpload

// Describes a commit.
struct CommitRequest
{
    // Ordered by offset.
    CompletedPartVector mParts;

    // Attributes to apply to the new file.
    std::map<std::string, std::string> mAttributes;
}; // CommitRequest

using AbortCallback = std::function<void(Error)>;
using CommitCallback = std::function<void(common::ErrorOr<FileResource>)>;
using PartUploadCallback = std::function<void(common::ErrorOr<CompletedPart>)>;

// The remote operations an upload relies on.
//
// Callbacks may be invoked on any thread, including the calling thread
// before the method returns. Each callback is invoked exactly once.
class UploadSessionClient
{
public:
    virtual ~UploadSessionClient() = default;

    // Delete a session.
    virtual void abort(const std::string& sessionID,
                       AbortCallback callback) = 0;

    // Assemble the session's parts into a file.
    //
    // digest is the base64 encoded SHA-1 of the whole file.
    virtual void commit(const std::string& sessionID,
                        const std::string& digest,
                        const CommitRequest& request,
                        CommitCallback callback) = 0;

    // Upload a single part.
    virtual void uploadPart(const std::string& sessionID,
                            const PartUpload& part,
                            PartUploadCallback callback) = 0;
}; // UploadSessionClient

} // upload
} // cumulus
