#include <algorithm>

#include <gtest/gtest.h>

#include <cumulus/backofftimer.h>
#include <cumulus/upload/byte_stream.h>
#include <cumulus/upload/part_scheduler.h>

#include "upload_utils.h"

using namespace cumulus;
using namespace cumulus::common;
using namespace cumulus::upload;

namespace
{

// What the service would say about a dispatched part.
CompletedPart confirm(const Dispatch& dispatch)
{
    PartUpload part;

    part.mData = dispatch.mData;
    part.mOffset = dispatch.mPart.mOffset;

    return ct::partFor(part);
}

RetryPolicy immediateRetries(unsigned int maxAttempts = 5)
{
    RetryPolicy policy;

    policy.mInitialDelay = deciseconds(0);
    policy.mMaximumDelay = deciseconds(0);
    policy.mMaxAttempts = maxAttempts;

    return policy;
}

} // anonymous

TEST(PartScheduler, completes_in_any_order)
{
    auto content = ct::makeContent(36);

    PartScheduler scheduler(UploadSource::fromBytes(content), 4, RetryPolicy());

    scheduler.begin(36, 10);

    auto schedule = scheduler.schedule();

    ASSERT_EQ(schedule.mDispatches.size(), 4u);
    EXPECT_TRUE(schedule.mFailures.empty());
    EXPECT_FALSE(schedule.mStalled);
    EXPECT_EQ(scheduler.inFlight(), 4u);

    for (auto i : {2u, 0u, 3u, 1u})
    {
        EXPECT_FALSE(scheduler.complete());

        auto outcome = scheduler.completed(i, 1, confirm(schedule.mDispatches[i]));

        EXPECT_EQ(outcome.mKind, Outcome::OK_COMPLETED);
        EXPECT_EQ(outcome.mCompleted.mOffset, static_cast<m_off_t>(i * 10));
    }

    EXPECT_TRUE(scheduler.complete());
    EXPECT_EQ(scheduler.inFlight(), 0u);

    auto parts = scheduler.parts();

    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0].mOffset, 0);
    EXPECT_EQ(parts[3].mOffset, 30);
    EXPECT_EQ(parts[3].mSize, 6);

    EXPECT_EQ(scheduler.digest(), ct::digestOf(content));

    // Content is released as parts are confirmed.
    EXPECT_FALSE(scheduler.table()[0].mData);
}

TEST(PartScheduler, clear_releases_everything)
{
    PartScheduler scheduler(UploadSource::fromBytes(ct::makeContent(36)), 2, RetryPolicy());

    scheduler.begin(36, 10);

    auto schedule = scheduler.schedule();

    ASSERT_EQ(schedule.mDispatches.size(), 2u);

    scheduler.clear();

    EXPECT_TRUE(scheduler.table().empty());
    EXPECT_TRUE(scheduler.source().released());
    EXPECT_EQ(scheduler.inFlight(), 0u);
    EXPECT_FALSE(scheduler.complete());

    // Late results are ignored.
    auto outcome = scheduler.completed(0, 1, confirm(schedule.mDispatches[0]));

    EXPECT_EQ(outcome.mKind, Outcome::OK_IGNORED);
    EXPECT_TRUE(scheduler.schedule().mDispatches.empty());
}

TEST(PartScheduler, permanent_failure_releases_slot)
{
    PartScheduler scheduler(UploadSource::fromBytes(ct::makeContent(36)), 1, RetryPolicy());

    scheduler.begin(36, 10);

    auto schedule = scheduler.schedule();

    ASSERT_EQ(schedule.mDispatches.size(), 1u);

    auto outcome = scheduler.completed(0, 1, unexpected(Error(API_ENOENT, 404)));

    EXPECT_EQ(outcome.mKind, Outcome::OK_FAILED);
    EXPECT_EQ(outcome.mFailure.mError, API_ENOENT);
    EXPECT_EQ(outcome.mFailure.mAttempts, 1u);
    EXPECT_EQ(scheduler.table()[0].mState, PS_FAILED);
    EXPECT_EQ(scheduler.inFlight(), 0u);

    // Other parts continue.
    schedule = scheduler.schedule();

    ASSERT_EQ(schedule.mDispatches.size(), 1u);
    EXPECT_EQ(schedule.mDispatches[0].mIndex, 1u);

    // Failed parts are retried when requeued.
    EXPECT_EQ(scheduler.requeue(), 1u);

    scheduler.completed(1, 1, confirm(schedule.mDispatches[0]));

    schedule = scheduler.schedule();

    ASSERT_EQ(schedule.mDispatches.size(), 1u);
    EXPECT_EQ(schedule.mDispatches[0].mIndex, 0u);
    EXPECT_EQ(schedule.mDispatches[0].mAttempt, 1u);
}

TEST(PartScheduler, read_failure_stops_reading)
{
    auto stream = std::make_shared<PipeByteStream>();

    stream->write(ct::makeContent(10));

    PartScheduler scheduler(UploadSource::fromStream(stream), 4, RetryPolicy());

    scheduler.begin(36, 10);

    auto schedule = scheduler.schedule();

    ASSERT_EQ(schedule.mDispatches.size(), 1u);
    EXPECT_TRUE(schedule.mStalled);

    stream->fail();

    schedule = scheduler.schedule();

    EXPECT_TRUE(schedule.mDispatches.empty());
    ASSERT_EQ(schedule.mFailures.size(), 1u);
    EXPECT_EQ(schedule.mFailures[0].mIndex, 1u);
    EXPECT_EQ(schedule.mFailures[0].mError, API_EREAD);

    // The failed part isn't read again until it's requeued.
    schedule = scheduler.schedule();

    EXPECT_TRUE(schedule.mFailures.empty());
    EXPECT_TRUE(schedule.mDispatches.empty());
}

TEST(PartScheduler, stale_results_are_ignored)
{
    PartScheduler scheduler(UploadSource::fromBytes(ct::makeContent(20)), 2, immediateRetries());

    scheduler.begin(20, 10);

    auto schedule = scheduler.schedule();

    ASSERT_EQ(schedule.mDispatches.size(), 2u);

    auto outcome = scheduler.completed(0, 1, unexpected(API_EAGAIN));

    ASSERT_EQ(outcome.mKind, Outcome::OK_RETRY);

    auto retry = scheduler.retry(0);

    ASSERT_TRUE(retry);
    EXPECT_EQ(retry->mAttempt, 2u);

    // A result from the first attempt arrives late.
    outcome = scheduler.completed(0, 1, confirm(schedule.mDispatches[0]));

    EXPECT_EQ(outcome.mKind, Outcome::OK_IGNORED);
    EXPECT_EQ(scheduler.table()[0].mState, PS_IN_FLIGHT);

    outcome = scheduler.completed(0, 2, confirm(*retry));

    EXPECT_EQ(outcome.mKind, Outcome::OK_COMPLETED);

    // Duplicate results are ignored.
    outcome = scheduler.completed(0, 2, confirm(*retry));

    EXPECT_EQ(outcome.mKind, Outcome::OK_IGNORED);

    // Out of range.
    outcome = scheduler.completed(7, 1, confirm(*retry));

    EXPECT_EQ(outcome.mKind, Outcome::OK_IGNORED);
}

TEST(PartScheduler, stalls_on_slow_stream)
{
    auto content = ct::makeContent(25);
    auto stream = std::make_shared<PipeByteStream>();

    PartScheduler scheduler(UploadSource::fromStream(stream), 4, RetryPolicy());

    scheduler.begin(25, 10);

    auto schedule = scheduler.schedule();

    EXPECT_TRUE(schedule.mDispatches.empty());
    EXPECT_TRUE(schedule.mStalled);

    stream->write(content.substr(0, 13));

    schedule = scheduler.schedule();

    ASSERT_EQ(schedule.mDispatches.size(), 1u);
    EXPECT_TRUE(schedule.mStalled);
    EXPECT_EQ(scheduler.source().buffered(), 3);

    stream->write(content.substr(13));
    stream->close();

    schedule = scheduler.schedule();

    ASSERT_EQ(schedule.mDispatches.size(), 2u);
    EXPECT_FALSE(schedule.mStalled);
    EXPECT_EQ(*schedule.mDispatches[1].mData, content.substr(20));
}

TEST(PartScheduler, transient_failure_keeps_slot)
{
    PartScheduler scheduler(UploadSource::fromBytes(ct::makeContent(36)), 1, immediateRetries(2));

    scheduler.begin(36, 10);

    auto schedule = scheduler.schedule();

    ASSERT_EQ(schedule.mDispatches.size(), 1u);

    auto outcome = scheduler.completed(0, 1, unexpected(Error(API_ERATELIMIT, 429)));

    EXPECT_EQ(outcome.mKind, Outcome::OK_RETRY);
    EXPECT_EQ(outcome.mDelay.count(), 0);
    EXPECT_EQ(scheduler.table()[0].mState, PS_PENDING);

    // The part waiting for its retry still occupies the only slot.
    EXPECT_EQ(scheduler.inFlight(), 1u);
    EXPECT_TRUE(scheduler.schedule().mDispatches.empty());

    auto retry = scheduler.retry(0);

    ASSERT_TRUE(retry);

    // Retries are only dispatched once.
    EXPECT_FALSE(scheduler.retry(0));

    outcome = scheduler.completed(0, retry->mAttempt, unexpected(Error(API_ERATELIMIT, 429)));

    EXPECT_EQ(outcome.mKind, Outcome::OK_FAILED);
    EXPECT_EQ(outcome.mFailure.mAttempts, 2u);
    EXPECT_EQ(scheduler.inFlight(), 0u);
}

TEST(RetryPolicy, backoff_grows_and_is_capped)
{
    PrnGen rng;
    RetryPolicy policy;

    auto timer = policy.timer(rng);

    // The first retry waits for the initial delay.
    EXPECT_EQ(timer->backoffdelta(), 10);

    dstime previous = 0;

    for (auto i = 0; i < 8; ++i)
    {
        timer->backoff();

        auto delta = timer->backoffdelta();

        EXPECT_LE(delta, 300);
        EXPECT_GE(delta, std::min<dstime>(previous, 300));

        previous = delta;
    }

    EXPECT_EQ(previous, 300);

    timer->reset();

    EXPECT_EQ(timer->backoffdelta(), 10);
    EXPECT_EQ(timer->nextset(), 0);
}

TEST(RetryPolicy, classifies_errors)
{
    EXPECT_TRUE(retryable(LOCAL_ETIMEOUT));
    EXPECT_TRUE(retryable(API_EAGAIN));
    EXPECT_TRUE(retryable(Error(API_ERATELIMIT, 429)));
    EXPECT_TRUE(retryable(Error(API_ETEMPUNAVAIL, 503)));
    EXPECT_TRUE(retryable(Error(API_EFAILED, 500)));

    // Errors that never reached the service.
    EXPECT_TRUE(retryable(API_EINTERNAL));

    EXPECT_FALSE(retryable(Error(API_EACCESS, 401)));
    EXPECT_FALSE(retryable(Error(API_ENOENT, 404)));
    EXPECT_FALSE(retryable(Error(API_ERANGE, 416)));
    EXPECT_FALSE(retryable(Error(API_EINTERNAL, 200)));
    EXPECT_FALSE(retryable(API_EREAD));
    EXPECT_FALSE(retryable(API_EARGS));
    EXPECT_FALSE(retryable(LOCAL_ABANDONED));

    RetryPolicy policy;

    EXPECT_FALSE(policy.exhausted(4));
    EXPECT_TRUE(policy.exhausted(5));
}
