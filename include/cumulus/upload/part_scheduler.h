#pragma once

#include <cumulus/common/deciseconds.h>
#include <cumulus/common/error_or_forward.h>
#include <cumulus/crypto/cryptopp.h>
#include <cumulus/upload/chunk_table.h>
#include <cumulus/upload/digest_accumulator.h>
#include <cumulus/upload/retry_policy.h>
#include <cumulus/upload/upload_source.h>

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cumulus
{
namespace upload
{

// A part that should be handed to the client.
struct Dispatch
{
    std::size_t mIndex;

    // Identifies this attempt so stale results can be recognized.
    unsigned int mAttempt;

    PendingPart mPart;

    std::shared_ptr<const std::string> mData;
}; // Dispatch

using DispatchVector = std::vector<Dispatch>;

// A part that has failed for good.
struct Failure
{
    std::size_t mIndex;

    PendingPart mPart;

    Error mError;

    unsigned int mAttempts;
}; // Failure

using FailureVector = std::vector<Failure>;

// What should be done after a round of scheduling.
struct Schedule
{
    // Parts to upload.
    DispatchVector mDispatches;

    // Parts that couldn't be read.
    FailureVector mFailures;

    // The source has no data right now, poll it later.
    bool mStalled = false;
}; // Schedule

// What became of a part when its upload finished.
struct Outcome
{
    enum Kind : unsigned int
    {
        // The result was stale and has been discarded.
        OK_IGNORED,
        // The part has been confirmed.
        OK_COMPLETED,
        // The part should be tried again after mDelay.
        OK_RETRY,
        // The part has failed for good.
        OK_FAILED
    }; // Kind

    Kind mKind = OK_IGNORED;

    // Valid when mKind is OK_COMPLETED.
    CompletedPart mCompleted;

    // Valid when mKind is OK_RETRY.
    common::deciseconds mDelay = common::deciseconds(0);

    // Valid when mKind is OK_FAILED.
    Failure mFailure{};
}; // Outcome

// Decides which parts are uploaded when.
//
// The scheduler performs no I/O of its own and is not thread safe: the
// uploader drives it under its lock. Parts are read from the source in
// offset order and fed to the digest as they are read so the digest
// doesn't depend on the order in which uploads complete.
class PartScheduler
{
    // Read the next unread part from the source.
    bool read(Schedule& schedule);

    DigestAccumulator mDigest;

    // How many parts are occupying an upload slot?
    std::size_t mInFlight = 0u;

    // Index of the next part to read from the source.
    std::size_t mNextRead = 0u;

    // How many uploads may be in flight at once?
    std::size_t mParallelism;

    // Parts whose content is held and that are waiting for a slot.
    std::deque<std::size_t> mReady;

    RetryPolicy mRetryPolicy;

    // Adds jitter to retry delays.
    PrnGen mRNG;

    UploadSource mSource;

    ChunkTable mTable;

public:
    PartScheduler(UploadSource source,
                  std::size_t parallelism,
                  const RetryPolicy& retryPolicy);

    // Partition [0, totalSize) into parts of partSize bytes.
    void begin(m_off_t totalSize, m_off_t partSize);

    // Release the table, the source and the digest.
    void clear();

    // Has every part been confirmed?
    bool complete() const;

    // Record the result of an upload attempt.
    Outcome completed(std::size_t index,
                      unsigned int attempt,
                      common::ErrorOr<CompletedPart> result);

    // The base64 encoded SHA-1 of the content.
    std::string digest();

    // How many uploads are occupying a slot?
    std::size_t inFlight() const;

    // Confirmed parts, ordered by offset.
    CompletedPartVector parts() const;

    // Retry failed parts.
    //
    // Returns the number of parts that will be retried.
    std::size_t requeue();

    // The backoff for a part has elapsed.
    std::optional<Dispatch> retry(std::size_t index);

    // Fill free upload slots.
    Schedule schedule();

    const UploadSource& source() const;

    const ChunkTable& table() const;
}; // PartScheduler

} // upload
} // cumulus
