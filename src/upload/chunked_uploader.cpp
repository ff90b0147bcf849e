#include <algorithm>
#include <cassert>
#include <iterator>

#include <cumulus/backofftimer.h>
#include <cumulus/common/logging.h>
#include <cumulus/common/task_executor.h>
#include <cumulus/upload/chunked_uploader.h>
#include <cumulus/upload/logger.h>

namespace cumulus
{
namespace upload
{

using namespace common;

void ChunkedUploader::beginCommit(Actions& actions)
{
    PendingCommit commit;

    commit.mDigest = mScheduler.digest();
    commit.mRequest.mAttributes = mOptions.mFileAttributes;
    commit.mRequest.mParts = mScheduler.parts();

    LogDebugF(logger(),
              "Committing %zu parts to session %s",
              commit.mRequest.mParts.size(),
              mSession.mID.c_str());

    mCommit = commit;
    mState = US_COMMITTING;

    actions.mCommit = std::move(commit);
}

void ChunkedUploader::cancelTasks()
{
    for (auto& task : mTasks)
        task.cancel();

    mTasks.clear();
}

void ChunkedUploader::onAborted(Error result)
{
    Actions actions;

    {
        std::lock_guard<std::mutex> guard(mLock);

        // We've been asked to abort again since this request was sent.
        if (mState != US_ABORTING)
            return;

        if (result == API_OK)
        {
            LogInfoF(logger(), "Session %s aborted", mSession.mID.c_str());

            mState = US_ABORTED;

            mPendingEvents.emplace_back(UploadAborted());
        }
        else
        {
            LogWarningF(logger(),
                        "Couldn't abort session %s: %s",
                        mSession.mID.c_str(),
                        errorstring(result));

            mState = US_ABORT_FAILED;

            mPendingEvents.emplace_back(AbortFailed{result});
        }

        // Does nothing if a failed commit has already been published.
        publish(unexpected(LOCAL_ABANDONED));
    }

    perform(std::move(actions));
}

void ChunkedUploader::onCommitted(ResultType result)
{
    Actions actions;

    {
        std::lock_guard<std::mutex> guard(mLock);

        // Upload's been aborted.
        if (mState != US_COMMITTING)
            return;

        if (result)
        {
            LogInfoF(logger(),
                     "Session %s committed as file %s",
                     mSession.mID.c_str(),
                     result->mID.c_str());

            mState = US_COMPLETED;

            mPendingEvents.emplace_back(UploadCompleted{*result});

            mScheduler.clear();
        }
        else
        {
            LogWarningF(logger(),
                        "Couldn't commit session %s: %s",
                        mSession.mID.c_str(),
                        errorstring(result.error()));

            mState = US_FAILED;

            mPendingEvents.emplace_back(UploadFailed{result.error(), mSession.mID});
        }

        publish(std::move(result));
    }

    perform(std::move(actions));
}

void ChunkedUploader::onPartUploaded(std::size_t index,
                                     unsigned int attempt,
                                     ErrorOr<CompletedPart> result)
{
    Actions actions;

    {
        std::lock_guard<std::mutex> guard(mLock);

        // Results that arrive after an abort are of no interest.
        if (mState != US_UPLOADING)
            return;

        auto outcome = mScheduler.completed(index, attempt, std::move(result));

        switch (outcome.mKind)
        {
        case Outcome::OK_COMPLETED:
            mPendingEvents.emplace_back(PartUploaded{outcome.mCompleted,
                                                      mScheduler.table().count(PS_COMPLETED),
                                                      mScheduler.table().size()});
            break;
        case Outcome::OK_FAILED:
            LogWarningF(logger(),
                        "Part at offset %lld failed after %u attempt(s): %s",
                        static_cast<long long>(outcome.mFailure.mPart.mOffset),
                        outcome.mFailure.mAttempts,
                        errorstring(outcome.mFailure.mError));

            mPendingEvents.emplace_back(PartFailed{outcome.mFailure.mPart,
                                                    outcome.mFailure.mError,
                                                    outcome.mFailure.mAttempts});
            break;
        case Outcome::OK_IGNORED:
            return;
        case Outcome::OK_RETRY:
            queue([this, index]() { onRetry(index); },
                  std::chrono::steady_clock::now() + outcome.mDelay);
            break;
        }

        pump(actions);
    }

    perform(std::move(actions));
}

void ChunkedUploader::onPoll()
{
    Actions actions;

    {
        std::lock_guard<std::mutex> guard(mLock);

        mPollQueued = false;

        if (mState != US_UPLOADING)
            return;

        pump(actions);
    }

    perform(std::move(actions));
}

void ChunkedUploader::onRetry(std::size_t index)
{
    Actions actions;

    {
        std::lock_guard<std::mutex> guard(mLock);

        if (mState != US_UPLOADING)
            return;

        auto dispatch = mScheduler.retry(index);

        if (!dispatch)
            return;

        actions.mDispatches.emplace_back(std::move(*dispatch));
    }

    perform(std::move(actions));
}

void ChunkedUploader::emit()
{
    std::unique_lock<std::mutex> lock(mLock);

    // Another thread's delivering events and will deliver ours too.
    if (mEmitting)
        return;

    mEmitting = true;

    while (!mPendingEvents.empty())
    {
        auto event = std::move(mPendingEvents.front());

        mPendingEvents.pop_front();

        lock.unlock();

        try
        {
            notify(event);
        }
        catch (std::exception& exception)
        {
            LogWarningF(logger(),
                        "Observer threw an exception: %s",
                        exception.what());
        }

        lock.lock();
    }

    mEmitting = false;
}

void ChunkedUploader::perform(Actions actions)
{
    emit();

    std::weak_ptr<ChunkedUploader> uploader = weak_from_this();

    for (auto& dispatch : actions.mDispatches)
    {
        PartUpload part;

        {
            std::lock_guard<std::mutex> guard(mLock);

            // Upload's been aborted while we were emitting events.
            if (mState != US_UPLOADING)
                return;

            part.mData = std::move(dispatch.mData);
            part.mOffset = dispatch.mPart.mOffset;
            part.mTimeout = mOptions.mPartTimeout;
            part.mTotalSize = mTotalSize;
        }

        auto index = dispatch.mIndex;
        auto attempt = dispatch.mAttempt;

        mClient.uploadPart(mSession.mID,
                           part,
                           [attempt, index, uploader](ErrorOr<CompletedPart> result) {
                               if (auto self = uploader.lock())
                                   self->onPartUploaded(index, attempt, std::move(result));
                           });
    }

    if (!actions.mCommit)
        return;

    {
        std::lock_guard<std::mutex> guard(mLock);

        if (mState != US_COMMITTING)
            return;
    }

    mClient.commit(mSession.mID,
                   actions.mCommit->mDigest,
                   actions.mCommit->mRequest,
                   [uploader](ErrorOr<FileResource> result) {
                       if (auto self = uploader.lock())
                           self->onCommitted(std::move(result));
                   });
}

void ChunkedUploader::pump(Actions& actions)
{
    assert(mState == US_UPLOADING);

    auto schedule = mScheduler.schedule();

    for (auto& failure : schedule.mFailures)
    {
        LogWarningF(logger(),
                    "Couldn't read part at offset %lld: %s",
                    static_cast<long long>(failure.mPart.mOffset),
                    errorstring(failure.mError));

        mPendingEvents.emplace_back(PartFailed{failure.mPart,
                                                failure.mError,
                                                failure.mAttempts});
    }

    std::move(schedule.mDispatches.begin(),
              schedule.mDispatches.end(),
              std::back_inserter(actions.mDispatches));

    // Ask the stream for more data later.
    if (schedule.mStalled && !mPollQueued)
    {
        mPollQueued = true;

        queue([this]() { onPoll(); },
              std::chrono::steady_clock::now() + mOptions.mStreamPollInterval);
    }

    if (mScheduler.complete())
        beginCommit(actions);
}

void ChunkedUploader::publish(ResultType result)
{
    if (mPublished)
        return;

    mPromise.set_value(std::move(result));
    mPublished = true;
}

void ChunkedUploader::queue(std::function<void()> function,
                            std::chrono::steady_clock::time_point when)
{
    std::weak_ptr<ChunkedUploader> uploader = weak_from_this();

    auto wrapper = [function = std::move(function), uploader](const Task& task) {
        // Task's been cancelled.
        if (task.cancelled())
            return;

        // Keep ourselves alive while the function executes.
        if (auto self = uploader.lock())
            function();
    }; // wrapper

    // Forget about tasks that have already run.
    mTasks.erase(std::remove_if(mTasks.begin(),
                                mTasks.end(),
                                [](const Task& task) {
                                    return task.completed() || task.cancelled();
                                }),
                 mTasks.end());

    mTasks.emplace_back(mExecutor.execute(std::move(wrapper), when, true));
}

ChunkedUploader::ChunkedUploader(Token,
                                 UploadSessionClient& client,
                                 TaskExecutor& executor,
                                 UploadSession session,
                                 UploadSource source,
                                 m_off_t totalSize,
                                 ChunkedUploadOptions options)
  : UploadEventEmitter()
  , mClient(client)
  , mCommit()
  , mExecutor(executor)
  , mLock()
  , mOptions(std::move(options))
  , mPromise()
  , mResult(mPromise.get_future().share())
  , mScheduler(std::move(source),
               mOptions.mParallelism,
               mOptions.mRetryPolicy)
  , mSession(std::move(session))
  , mTasks()
  , mTotalSize(totalSize)
{
}

ChunkedUploader::~ChunkedUploader()
{
    cancelTasks();
}

std::shared_ptr<ChunkedUploader> ChunkedUploader::create(UploadSessionClient& client,
                                                         TaskExecutor& executor,
                                                         UploadSession session,
                                                         UploadSource source,
                                                         m_off_t totalSize,
                                                         ChunkedUploadOptions options)
{
    if (session.mPartSize <= 0)
        throw LogErrorF(logger(),
                        "Session %s has an invalid part size: %lld",
                        session.mID.c_str(),
                        static_cast<long long>(session.mPartSize));

    if (!options.mParallelism)
        throw LogError1(logger(), "Parallelism must be at least one");

    if (totalSize < 0)
        throw LogErrorF(logger(),
                        "Invalid total size: %lld",
                        static_cast<long long>(totalSize));

    if (source.released())
        throw LogError1(logger(), "Source has already been released");

    // Fixed content must be exactly as long as the file.
    if (!source.streaming() && source.size() != totalSize)
        throw LogErrorF(logger(),
                        "Content is %lld bytes long but the file is %lld bytes long",
                        static_cast<long long>(source.size()),
                        static_cast<long long>(totalSize));

    return std::make_shared<ChunkedUploader>(Token(),
                                             client,
                                             executor,
                                             std::move(session),
                                             std::move(source),
                                             totalSize,
                                             std::move(options));
}

void ChunkedUploader::abort()
{
    {
        std::lock_guard<std::mutex> guard(mLock);

        switch (mState)
        {
        case US_ABORTED:
        case US_ABORTING:
        case US_COMPLETED:
            LogDebugF(logger(),
                      "Ignoring abort of session %s as it is %s",
                      mSession.mID.c_str(),
                      toString(mState));
            return;
        default:
            break;
        }

        LogInfoF(logger(),
                 "Aborting session %s while %s",
                 mSession.mID.c_str(),
                 toString(mState));

        mState = US_ABORTING;

        cancelTasks();

        mPollQueued = false;

        // Forget the parts, the content and the digest.
        mScheduler.clear();
    }

    std::weak_ptr<ChunkedUploader> uploader = weak_from_this();

    mClient.abort(mSession.mID, [uploader](Error result) {
        if (auto self = uploader.lock())
            self->onAborted(result);
    });
}

std::size_t ChunkedUploader::count(PartState state) const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mScheduler.table().count(state);
}

std::size_t ChunkedUploader::parts() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mScheduler.table().size();
}

std::shared_future<ChunkedUploader::ResultType> ChunkedUploader::result() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mResult;
}

Error ChunkedUploader::retryCommit()
{
    Actions actions;

    {
        std::lock_guard<std::mutex> guard(mLock);

        if (mState != US_FAILED || !mCommit)
            return API_EARGS;

        LogInfoF(logger(), "Retrying commit of session %s", mSession.mID.c_str());

        // Callers waiting on the old result have already seen the failure.
        mPromise = std::promise<ResultType>();
        mResult = mPromise.get_future().share();
        mPublished = false;
        mState = US_COMMITTING;

        actions.mCommit = mCommit;
    }

    perform(std::move(actions));

    return API_OK;
}

const UploadSession& ChunkedUploader::session() const
{
    return mSession;
}

bool ChunkedUploader::sourceReleased() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mScheduler.source().released();
}

void ChunkedUploader::start()
{
    Actions actions;

    {
        std::lock_guard<std::mutex> guard(mLock);

        switch (mState)
        {
        case US_IDLE:
            LogDebugF(logger(),
                      "Uploading %lld bytes to session %s",
                      static_cast<long long>(mTotalSize),
                      mSession.mID.c_str());

            mState = US_UPLOADING;
            mScheduler.begin(mTotalSize, mSession.mPartSize);
            break;
        case US_UPLOADING:
        {
            auto requeued = mScheduler.requeue();

            LogDebugF(logger(),
                      "Retrying %zu failed part(s) of session %s",
                      requeued,
                      mSession.mID.c_str());
            break;
        }
        default:
            LogDebugF(logger(),
                      "Ignoring start of session %s as it is %s",
                      mSession.mID.c_str(),
                      toString(mState));
            return;
        }

        pump(actions);
    }

    perform(std::move(actions));
}

UploadState ChunkedUploader::state() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mState;
}

m_off_t ChunkedUploader::totalSize() const
{
    return mTotalSize;
}

} // upload
} // cumulus
