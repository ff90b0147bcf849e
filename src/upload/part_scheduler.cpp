#include <chrono>

#include <cumulus/backofftimer.h>
#include <cumulus/common/error_or.h>
#include <cumulus/common/logging.h>
#include <cumulus/upload/logger.h>
#include <cumulus/upload/part_scheduler.h>

namespace cumulus
{
namespace upload
{

bool PartScheduler::read(Schedule& schedule)
{
    auto index = mNextRead;
    auto& entry = mTable[index];

    auto failed = [&](Error error) {
        entry.mState = PS_FAILED;
        entry.mLastError = error;

        schedule.mFailures.push_back({index, entry.mPart, error, entry.mAttempts});

        return false;
    }; // failed

    auto result = mSource.read(entry.mPart.mOffset, entry.mPart.mSize);

    if (!result)
        return failed(result.error());

    // Source has nothing for us right now.
    if (std::holds_alternative<NotReady>(*result))
    {
        schedule.mStalled = true;
        return false;
    }

    auto data = std::get<Ready>(std::move(*result)).mData;

    // Source is shorter than it claimed to be.
    if (static_cast<m_off_t>(data->size()) != entry.mPart.mSize)
    {
        LogWarningF(logger(),
                    "Source ended early: part at offset %lld has %zu of %lld bytes",
                    static_cast<long long>(entry.mPart.mOffset),
                    data->size(),
                    static_cast<long long>(entry.mPart.mSize));

        return failed(API_EREAD);
    }

    // Parts are read in offset order so the digest sees the content in order.
    if (auto error = mDigest.add(entry.mPart.mOffset, *data); error != API_OK)
        return failed(error);

    entry.mData = std::move(data);
    entry.mState = PS_IN_FLIGHT;
    entry.mAttempts = 1;

    ++mInFlight;
    ++mNextRead;

    schedule.mDispatches.push_back({index, entry.mAttempts, entry.mPart, entry.mData});

    return true;
}

PartScheduler::PartScheduler(UploadSource source,
                             std::size_t parallelism,
                             const RetryPolicy& retryPolicy)
  : mDigest()
  , mParallelism(parallelism)
  , mReady()
  , mRetryPolicy(retryPolicy)
  , mRNG()
  , mSource(std::move(source))
  , mTable()
{
}

void PartScheduler::begin(m_off_t totalSize, m_off_t partSize)
{
    mTable = ChunkTable(totalSize, partSize);

    mDigest.reset();
    mInFlight = 0;
    mNextRead = 0;
    mReady.clear();

    LogDebugF(logger(),
              "Partitioned %lld bytes into %zu parts of %lld bytes",
              static_cast<long long>(totalSize),
              mTable.size(),
              static_cast<long long>(partSize));
}

void PartScheduler::clear()
{
    mTable.clear();
    mSource.release();
    mDigest.reset();
    mReady.clear();
    mInFlight = 0;
    mNextRead = 0;
}

bool PartScheduler::complete() const
{
    return mTable.complete() && !mSource.released();
}

Outcome PartScheduler::completed(std::size_t index,
                                 unsigned int attempt,
                                 common::ErrorOr<CompletedPart> result)
{
    Outcome outcome;

    // Table's been cleared or the result belongs to an earlier attempt.
    if (index >= mTable.size())
        return outcome;

    auto& entry = mTable[index];

    if (entry.mState != PS_IN_FLIGHT || entry.mAttempts != attempt)
        return outcome;

    if (result)
    {
        // The part's content is no longer needed.
        entry.mData.reset();
        entry.mCompleted = std::move(*result);
        entry.mLastError = API_OK;
        entry.mState = PS_COMPLETED;

        --mInFlight;

        outcome.mKind = Outcome::OK_COMPLETED;
        outcome.mCompleted = *entry.mCompleted;

        return outcome;
    }

    entry.mLastError = result.error();

    // Try the part again later, it keeps its slot while it waits.
    if (retryable(entry.mLastError) && !mRetryPolicy.exhausted(entry.mAttempts))
    {
        if (!entry.mBackoff)
            entry.mBackoff = mRetryPolicy.timer(mRNG);

        entry.mBackoff->backoff();
        entry.mState = PS_PENDING;

        outcome.mKind = Outcome::OK_RETRY;
        outcome.mDelay = common::deciseconds(entry.mBackoff->retryin());

        LogDebugF(logger(),
                  "Part at offset %lld failed on attempt %u, retrying in %lld ds",
                  static_cast<long long>(entry.mPart.mOffset),
                  entry.mAttempts,
                  static_cast<long long>(outcome.mDelay.count()));

        return outcome;
    }

    entry.mState = PS_FAILED;

    --mInFlight;

    outcome.mKind = Outcome::OK_FAILED;
    outcome.mFailure = {index, entry.mPart, entry.mLastError, entry.mAttempts};

    return outcome;
}

std::string PartScheduler::digest()
{
    return mDigest.finalize();
}

std::size_t PartScheduler::inFlight() const
{
    return mInFlight;
}

CompletedPartVector PartScheduler::parts() const
{
    return mTable.completedParts();
}

std::size_t PartScheduler::requeue()
{
    std::size_t count = 0;

    for (std::size_t i = 0; i < mTable.size(); ++i)
    {
        auto& entry = mTable[i];

        if (entry.mState != PS_FAILED)
            continue;

        entry.mAttempts = 0;
        entry.mBackoff.reset();
        entry.mState = PS_PENDING;

        ++count;

        // Parts that failed to be read will be read again.
        if (entry.mData)
            mReady.push_back(i);
    }

    return count;
}

std::optional<Dispatch> PartScheduler::retry(std::size_t index)
{
    if (index >= mTable.size())
        return std::nullopt;

    auto& entry = mTable[index];

    // Part isn't waiting for a retry.
    if (entry.mState != PS_PENDING || !entry.mData || !entry.mAttempts)
        return std::nullopt;

    entry.mState = PS_IN_FLIGHT;

    return Dispatch{index, ++entry.mAttempts, entry.mPart, entry.mData};
}

Schedule PartScheduler::schedule()
{
    Schedule schedule;

    while (mInFlight < mParallelism)
    {
        // Parts that failed earlier and are being tried again.
        if (!mReady.empty())
        {
            auto index = mReady.front();
            auto& entry = mTable[index];

            mReady.pop_front();

            entry.mAttempts = 1;
            entry.mState = PS_IN_FLIGHT;

            ++mInFlight;

            schedule.mDispatches.push_back({index, entry.mAttempts, entry.mPart, entry.mData});

            continue;
        }

        // Every part has been read.
        if (mNextRead >= mTable.size())
            break;

        // Couldn't read the next part, wait until it's requeued.
        if (mTable[mNextRead].mState == PS_FAILED)
            break;

        // Source has nothing for us or failed.
        if (!read(schedule))
            break;
    }

    return schedule;
}

const UploadSource& PartScheduler::source() const
{
    return mSource;
}

const ChunkTable& PartScheduler::table() const
{
    return mTable;
}

} // upload
} // cumulus
