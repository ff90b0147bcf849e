#pragma once

#include <cumulus/common/error_or.h>
#include <cumulus/common/task_queue.h>
#include <cumulus/upload/chunked_upload_options.h>
#include <cumulus/upload/part_scheduler.h>
#include <cumulus/upload/upload_event_emitter.h>
#include <cumulus/upload/upload_session.h>
#include <cumulus/upload/upload_session_client.h>
#include <cumulus/upload/upload_source.h>
#include <cumulus/upload/upload_state.h>

#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cumulus
{
namespace common
{

class TaskExecutor;

} // common

namespace upload
{

// Uploads content to an existing session in parts and commits it.
//
// Up to mParallelism parts are uploaded at once. Transient part
// failures are retried with exponential backoff. Once every part has
// been confirmed the session is committed with the parts ordered by
// offset and the SHA-1 of the whole content.
//
// Progress and outcomes are delivered to observers and, for the final
// file, through result().
class ChunkedUploader
  : public UploadEventEmitter
  , public std::enable_shared_from_this<ChunkedUploader>
{
    // Lets create() use std::make_shared.
    struct Token
    {
    }; // Token

    using ResultType = common::ErrorOr<FileResource>;

    // A commit that should be sent.
    struct PendingCommit
    {
        std::string mDigest;
        CommitRequest mRequest;
    }; // PendingCommit

    // What should be done once our lock has been released.
    struct Actions
    {
        std::optional<PendingCommit> mCommit;
        DispatchVector mDispatches;
    }; // Actions

    // Transition to US_COMMITTING.
    void beginCommit(Actions& actions);

    // Cancel any queued retries and polls.
    void cancelTasks();

    // Called when the service has responded to our abort.
    void onAborted(Error result);

    // Called when the service has responded to our commit.
    void onCommitted(ResultType result);

    // Called when a part's upload has finished.
    void onPartUploaded(std::size_t index,
                        unsigned int attempt,
                        common::ErrorOr<CompletedPart> result);

    // Called when a stalled stream should be polled.
    void onPoll();

    // Called when a part's backoff has elapsed.
    void onRetry(std::size_t index);

    // Deliver pending events to our observers.
    //
    // Only one thread delivers events at a time so observers see them
    // in the order they were queued.
    void emit();

    // Emit events and issue requests.
    void perform(Actions actions);

    // Fill free upload slots and check whether we can commit.
    void pump(Actions& actions);

    // Make a task's result available through result().
    void publish(ResultType result);

    // Queue a task for later execution.
    void queue(std::function<void()> function,
               std::chrono::steady_clock::time_point when);

    // Issues part uploads, commits and aborts.
    UploadSessionClient& mClient;

    // The commit we sent last, kept so it can be retried.
    std::optional<PendingCommit> mCommit;

    // Executes retries and polls.
    common::TaskExecutor& mExecutor;

    // Serializes access to our members.
    mutable std::mutex mLock;

    ChunkedUploadOptions mOptions;

    // Is some thread delivering mPendingEvents?
    bool mEmitting = false;

    // Has a poll of our source been queued?
    bool mPollQueued = false;

    // Fulfilled when the upload completes, fails to commit or is aborted.
    std::promise<ResultType> mPromise;

    bool mPublished = false;

    std::shared_future<ResultType> mResult;

    // Events queued while mLock was held, in the order they happened.
    std::deque<UploadEvent> mPendingEvents;

    PartScheduler mScheduler;

    const UploadSession mSession;

    UploadState mState = US_IDLE;

    // Retries and polls that may still execute.
    std::vector<common::Task> mTasks;

    const m_off_t mTotalSize;

public:
    ChunkedUploader(Token,
                    UploadSessionClient& client,
                    common::TaskExecutor& executor,
                    UploadSession session,
                    UploadSource source,
                    m_off_t totalSize,
                    ChunkedUploadOptions options);

    ~ChunkedUploader();

    // Instantiate an uploader.
    //
    // Throws if the session's part size or the parallelism isn't
    // positive, or if fixed content isn't exactly totalSize bytes long.
    static std::shared_ptr<ChunkedUploader> create(UploadSessionClient& client,
                                                   common::TaskExecutor& executor,
                                                   UploadSession session,
                                                   UploadSource source,
                                                   m_off_t totalSize,
                                                   ChunkedUploadOptions options = {});

    // Stop uploading and delete the session.
    //
    // Results of requests already issued are ignored. Exactly one of
    // UploadAborted or AbortFailed is emitted per call. Has no effect
    // once the upload has completed or while an abort is in progress.
    void abort();

    // How many parts are in this state?
    std::size_t count(PartState state) const;

    // How many parts does the upload consist of?
    std::size_t parts() const;

    // The upload's eventual result.
    //
    // A value when the session has been committed, LOCAL_ABANDONED if
    // the upload was aborted or the commit's error if it failed. A call
    // to retryCommit() makes a new result available.
    //
    // An abort's result is only made available once the service has
    // answered the abort, whether it succeeded or not.
    std::shared_future<ResultType> result() const;

    // Send the last commit again after it has failed.
    //
    // Yields API_EARGS unless the upload is in US_FAILED.
    Error retryCommit();

    const UploadSession& session() const;

    // Has the source been released?
    bool sourceReleased() const;

    // Begin uploading, or retry failed parts if we're already uploading.
    //
    // Calling start() more than once never uploads a part twice.
    void start();

    UploadState state() const;

    m_off_t totalSize() const;
}; // ChunkedUploader

using ChunkedUploaderPtr = std::shared_ptr<ChunkedUploader>;

} // upload
} // cumulus
