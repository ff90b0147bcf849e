#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <optional>
#include <string>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cumulus/common/task_executor.h>
#include <cumulus/upload/byte_stream.h>
#include <cumulus/upload/chunked_uploader.h>
#include <cumulus/upload/logger.h>

#include "upload_utils.h"

using namespace cumulus;
using namespace cumulus::common;
using namespace cumulus::upload;
using namespace testing;

namespace
{

using ResultType = ErrorOr<FileResource>;

// How long are we willing to wait for something to happen?
constexpr auto Timeout = std::chrono::seconds(8);

// Offsets of the parts in a commit.
std::vector<m_off_t> offsets(const CommitRequest& request)
{
    std::vector<m_off_t> offsets;

    for (auto& part : request.mParts)
        offsets.emplace_back(part.mOffset);

    return offsets;
}

// Wait for an upload's result.
bool ready(const std::shared_future<ResultType>& result)
{
    return result.wait_for(Timeout) == std::future_status::ready;
}

class ChunkedUploaderTest
  : public Test
{
protected:
    ChunkedUploaderTest()
      : Test()
      , mClient()
      , mExecutor(TaskExecutorFlags(), upload::logger())
      , mOptions()
    {
        // Retry immediately so the tests don't have to wait.
        mOptions.mRetryPolicy.mInitialDelay = deciseconds(0);
        mOptions.mRetryPolicy.mMaximumDelay = deciseconds(0);
    }

    ChunkedUploaderPtr create(UploadSource source,
                              m_off_t totalSize,
                              m_off_t partSize = 10)
    {
        auto uploader = ChunkedUploader::create(mClient,
                                                mExecutor,
                                                ct::makeSession(partSize),
                                                std::move(source),
                                                totalSize,
                                                mOptions);

        mEvents.attach(*uploader);

        return uploader;
    }

    ChunkedUploaderPtr create(const std::string& content, m_off_t partSize = 10)
    {
        return create(UploadSource::fromBytes(content),
                      static_cast<m_off_t>(content.size()),
                      partSize);
    }

    ct::FakeSessionClient mClient;
    ct::EventLog mEvents;
    TaskExecutor mExecutor;
    ChunkedUploadOptions mOptions;
}; // ChunkedUploaderTest

} // anonymous

TEST_F(ChunkedUploaderTest, abort_during_upload)
{
    mClient.mDeferUploads = true;

    auto uploader = create(ct::makeContent(36));

    uploader->start();

    ASSERT_EQ(mClient.deferredUploads(), 4u);

    uploader->abort();

    EXPECT_EQ(uploader->state(), US_ABORTED);
    EXPECT_EQ(uploader->parts(), 0u);
    EXPECT_TRUE(uploader->sourceReleased());
    EXPECT_EQ(mClient.aborts(), 1u);

    // Results of uploads issued before the abort are ignored.
    EXPECT_TRUE(mClient.completeUpload(0));
    EXPECT_TRUE(mClient.completeUpload(10));
    EXPECT_TRUE(mClient.completeUpload(20));
    EXPECT_TRUE(mClient.completeUpload(30));

    EXPECT_EQ(mEvents.count<PartUploaded>(), 0u);
    EXPECT_EQ(mEvents.count<UploadAborted>(), 1u);
    EXPECT_EQ(mEvents.count<AbortFailed>(), 0u);
    EXPECT_TRUE(mClient.commits().empty());

    auto result = uploader->result();

    ASSERT_TRUE(ready(result));
    ASSERT_FALSE(result.get());
    EXPECT_EQ(result.get().error(), LOCAL_ABANDONED);

    // A second abort has no effect.
    uploader->abort();

    EXPECT_EQ(mClient.aborts(), 1u);
    EXPECT_EQ(mEvents.count<UploadAborted>(), 1u);
}

TEST_F(ChunkedUploaderTest, abort_failure_can_be_retried)
{
    mClient.mAbortHandler = []() { return Error(API_EFAILED, 400); };
    mClient.mDeferUploads = true;

    auto uploader = create(ct::makeContent(36));

    uploader->start();
    uploader->abort();

    EXPECT_EQ(uploader->state(), US_ABORT_FAILED);
    EXPECT_EQ(mEvents.count<AbortFailed>(), 1u);
    EXPECT_EQ(mEvents.count<UploadAborted>(), 0u);

    mClient.mAbortHandler = []() { return Error(API_OK); };

    uploader->abort();

    EXPECT_EQ(uploader->state(), US_ABORTED);
    EXPECT_EQ(mEvents.count<AbortFailed>(), 1u);
    EXPECT_EQ(mEvents.count<UploadAborted>(), 1u);
    EXPECT_EQ(mClient.aborts(), 2u);
}

TEST_F(ChunkedUploaderTest, abort_ignored_while_aborting)
{
    mClient.mDeferAborts = true;
    mClient.mDeferUploads = true;

    auto uploader = create(ct::makeContent(36));

    uploader->start();
    uploader->abort();
    uploader->abort();

    EXPECT_EQ(uploader->state(), US_ABORTING);
    EXPECT_EQ(mClient.aborts(), 1u);

    mClient.completeAborts(API_OK);

    EXPECT_EQ(uploader->state(), US_ABORTED);
    EXPECT_EQ(mEvents.count<UploadAborted>(), 1u);
}

TEST_F(ChunkedUploaderTest, abort_result_waits_for_service)
{
    std::optional<bool> publishedEarly;

    mClient.mDeferUploads = true;

    auto uploader = create(ct::makeContent(36));

    mClient.mAbortHandler = [&]() {
        auto result = uploader->result();

        publishedEarly = result.wait_for(std::chrono::seconds(0))
                         == std::future_status::ready;

        return Error(API_OK);
    };

    uploader->start();
    uploader->abort();

    ASSERT_TRUE(publishedEarly);
    EXPECT_FALSE(*publishedEarly);

    auto result = uploader->result();

    ASSERT_TRUE(ready(result));
    EXPECT_EQ(result.get().error(), LOCAL_ABANDONED);
}

TEST_F(ChunkedUploaderTest, abort_result_waits_for_deferred_answer)
{
    mClient.mDeferAborts = true;
    mClient.mDeferUploads = true;

    auto uploader = create(ct::makeContent(36));

    uploader->start();
    uploader->abort();

    auto result = uploader->result();

    EXPECT_EQ(result.wait_for(std::chrono::seconds(0)), std::future_status::timeout);

    // Failed aborts are published too.
    mClient.completeAborts(Error(API_EFAILED, 500));

    ASSERT_TRUE(ready(result));
    EXPECT_EQ(result.get().error(), LOCAL_ABANDONED);
    EXPECT_EQ(uploader->state(), US_ABORT_FAILED);
    EXPECT_EQ(mEvents.count<AbortFailed>(), 1u);
}

TEST_F(ChunkedUploaderTest, events_are_delivered_one_at_a_time)
{
    mClient.mPartHandler = [](const PartUpload& part) -> ErrorOr<CompletedPart> {
        if (!part.mOffset)
            return unexpected(Error(API_EACCESS, 403));

        return ct::partFor(part);
    };

    auto uploader = create(ct::makeContent(36));

    std::size_t depth = 0u;
    std::size_t deepest = 0u;
    std::vector<std::string> names;

    // Abort from within an observer.
    uploader->addObserver([&](const UploadEvent& event) {
        deepest = std::max(deepest, ++depth);

        names.emplace_back(toString(event));

        if (std::holds_alternative<PartFailed>(event))
            uploader->abort();

        --depth;
    });

    uploader->start();

    EXPECT_EQ(uploader->state(), US_ABORTED);
    EXPECT_EQ(deepest, 1u);
    EXPECT_THAT(names, ElementsAre("PartFailed", "UploadAborted"));
}

TEST_F(ChunkedUploaderTest, abort_while_committing_ignores_commit)
{
    mClient.mDeferCommits = true;

    auto uploader = create(ct::makeContent(36));

    uploader->start();

    ASSERT_EQ(uploader->state(), US_COMMITTING);

    uploader->abort();

    mClient.completeCommits(FileResource());

    EXPECT_EQ(uploader->state(), US_ABORTED);
    EXPECT_EQ(mEvents.count<UploadCompleted>(), 0u);
    EXPECT_EQ(mEvents.count<UploadAborted>(), 1u);

    auto result = uploader->result();

    ASSERT_TRUE(ready(result));
    EXPECT_EQ(result.get().error(), LOCAL_ABANDONED);
}

TEST_F(ChunkedUploaderTest, commit_failure_can_be_retried)
{
    mClient.mCommitHandler = [](const std::string&, const CommitRequest&) -> ResultType {
        return unexpected(Error(API_ETEMPUNAVAIL, 503));
    };

    auto uploader = create(ct::makeContent(36));

    // Commits can only be retried once they've failed.
    EXPECT_EQ(uploader->retryCommit(), API_EARGS);

    uploader->start();

    EXPECT_EQ(uploader->state(), US_FAILED);
    EXPECT_EQ(mEvents.count<UploadFailed>(), 1u);

    auto failed = std::get<UploadFailed>(mEvents.events().back());

    EXPECT_EQ(failed.mError, API_ETEMPUNAVAIL);
    EXPECT_EQ(failed.mError.getHttpStatus(), 503);
    EXPECT_EQ(failed.mSessionID, uploader->session().mID);

    auto result = uploader->result();

    ASSERT_TRUE(ready(result));
    EXPECT_EQ(result.get().error(), API_ETEMPUNAVAIL);

    mClient.mCommitHandler = [](const std::string&, const CommitRequest&) -> ResultType {
        FileResource file;

        file.mID = "6789";

        return file;
    };

    EXPECT_EQ(uploader->retryCommit(), API_OK);
    EXPECT_EQ(uploader->state(), US_COMPLETED);

    auto commits = mClient.commits();

    ASSERT_EQ(commits.size(), 2u);
    EXPECT_EQ(commits[0].mDigest, commits[1].mDigest);
    EXPECT_EQ(offsets(commits[0].mRequest), offsets(commits[1].mRequest));

    result = uploader->result();

    ASSERT_TRUE(ready(result));
    ASSERT_TRUE(result.get());
    EXPECT_EQ(result.get()->mID, "6789");

    // Parts are never uploaded twice.
    EXPECT_EQ(mClient.uploads().size(), 4u);
}

TEST_F(ChunkedUploaderTest, completes_fixed_upload)
{
    auto content = ct::makeContent(36);

    mOptions.mFileAttributes["content_modified_at"] = "2026-10-18T10:00:00Z";

    auto uploader = create(content);

    EXPECT_EQ(uploader->state(), US_IDLE);

    uploader->start();

    EXPECT_EQ(uploader->state(), US_COMPLETED);
    EXPECT_EQ(uploader->parts(), 0u);
    EXPECT_TRUE(uploader->sourceReleased());

    auto uploads = mClient.uploads();

    ASSERT_EQ(uploads.size(), 4u);

    for (auto& upload : uploads)
    {
        EXPECT_EQ(upload.mTotalSize, 36);
        EXPECT_EQ(*upload.mData, content.substr(static_cast<std::size_t>(upload.mOffset), 10));
    }

    auto commits = mClient.commits();

    ASSERT_EQ(commits.size(), 1u);
    EXPECT_EQ(commits[0].mDigest, ct::digestOf(content));
    EXPECT_THAT(offsets(commits[0].mRequest), ElementsAre(0, 10, 20, 30));
    EXPECT_EQ(commits[0].mRequest.mAttributes.at("content_modified_at"),
              "2026-10-18T10:00:00Z");

    EXPECT_EQ(mEvents.count<PartUploaded>(), 4u);
    EXPECT_EQ(mEvents.count<UploadCompleted>(), 1u);
    EXPECT_TRUE(terminal(mEvents.events().back()));

    auto result = uploader->result();

    ASSERT_TRUE(ready(result));
    ASSERT_TRUE(result.get());
    EXPECT_EQ(result.get()->mID, "12345");

    // Completed uploads can't be aborted.
    uploader->abort();

    EXPECT_EQ(uploader->state(), US_COMPLETED);
    EXPECT_EQ(mClient.aborts(), 0u);
}

TEST_F(ChunkedUploaderTest, create_rejects_invalid_arguments)
{
    EXPECT_THROW(create(ct::makeContent(36), 0), std::runtime_error);
    EXPECT_THROW(create(ct::makeContent(36), -1), std::runtime_error);

    // Content must be exactly as long as the file.
    EXPECT_THROW(create(UploadSource::fromBytes(ct::makeContent(35)), 36),
                 std::runtime_error);

    mOptions.mParallelism = 0;

    EXPECT_THROW(create(ct::makeContent(36)), std::runtime_error);
}

TEST_F(ChunkedUploaderTest, empty_upload_commits_immediately)
{
    auto uploader = create(std::string());

    uploader->start();

    EXPECT_EQ(uploader->state(), US_COMPLETED);
    EXPECT_TRUE(mClient.uploads().empty());

    auto commits = mClient.commits();

    ASSERT_EQ(commits.size(), 1u);
    EXPECT_TRUE(commits[0].mRequest.mParts.empty());
    EXPECT_EQ(commits[0].mDigest, ct::digestOf(std::string()));
}

TEST_F(ChunkedUploaderTest, out_of_order_completion)
{
    auto content = ct::makeContent(36);

    mClient.mDeferUploads = true;

    auto uploader = create(content);

    uploader->start();

    ASSERT_EQ(mClient.deferredUploads(), 4u);

    EXPECT_TRUE(mClient.completeUpload(30));
    EXPECT_TRUE(mClient.completeUpload(10));
    EXPECT_TRUE(mClient.completeUpload(0));

    EXPECT_EQ(uploader->state(), US_UPLOADING);
    EXPECT_EQ(uploader->count(PS_COMPLETED), 3u);

    EXPECT_TRUE(mClient.completeUpload(20));

    auto commits = mClient.commits();

    ASSERT_EQ(commits.size(), 1u);
    EXPECT_THAT(offsets(commits[0].mRequest), ElementsAre(0, 10, 20, 30));
    EXPECT_EQ(commits[0].mDigest, ct::digestOf(content));

    // Progress is reported as parts are confirmed.
    auto events = mEvents.events();

    ASSERT_EQ(events.size(), 5u);
    EXPECT_EQ(std::get<PartUploaded>(events[0]).mPart.mOffset, 30);
    EXPECT_EQ(std::get<PartUploaded>(events[0]).mCompleted, 1u);
    EXPECT_EQ(std::get<PartUploaded>(events[3]).mCompleted, 4u);
    EXPECT_EQ(std::get<PartUploaded>(events[3]).mTotal, 4u);
    EXPECT_TRUE(std::holds_alternative<UploadCompleted>(events[4]));
}

TEST_F(ChunkedUploaderTest, parallelism_is_bounded)
{
    mClient.mDeferUploads = true;
    mOptions.mParallelism = 2;

    auto uploader = create(ct::makeContent(50));

    uploader->start();

    EXPECT_EQ(mClient.uploads().size(), 2u);
    EXPECT_EQ(uploader->count(PS_IN_FLIGHT), 2u);

    EXPECT_TRUE(mClient.completeUpload(10));

    EXPECT_EQ(mClient.uploads().size(), 3u);
    EXPECT_EQ(mClient.deferredUploads(), 2u);

    EXPECT_TRUE(mClient.completeUpload(0));
    EXPECT_TRUE(mClient.completeUpload(20));
    EXPECT_TRUE(mClient.completeUpload(30));
    EXPECT_TRUE(mClient.completeUpload(40));

    EXPECT_EQ(uploader->state(), US_COMPLETED);
    EXPECT_EQ(mClient.uploads().size(), 5u);
}

TEST_F(ChunkedUploaderTest, permanent_failure_is_reported)
{
    mClient.mPartHandler = [](const PartUpload& part) -> ErrorOr<CompletedPart> {
        if (part.mOffset == 10)
            return unexpected(Error(API_EACCESS, 403));

        return ct::partFor(part);
    };

    auto uploader = create(ct::makeContent(36));

    uploader->start();

    // Other parts carry on.
    EXPECT_EQ(uploader->state(), US_UPLOADING);
    EXPECT_EQ(uploader->count(PS_COMPLETED), 3u);
    EXPECT_EQ(uploader->count(PS_FAILED), 1u);
    EXPECT_EQ(mClient.uploads(10), 1u);
    EXPECT_TRUE(mClient.commits().empty());

    ASSERT_EQ(mEvents.count<PartFailed>(), 1u);

    for (auto& event : mEvents.events())
    {
        if (auto* failed = std::get_if<PartFailed>(&event))
        {
            EXPECT_EQ(failed->mPart, (PendingPart{10, 10}));
            EXPECT_EQ(failed->mError, API_EACCESS);
            EXPECT_EQ(failed->mAttempts, 1u);
        }
    }

    // Resume the upload once the problem has gone away.
    mClient.mPartHandler = [](const PartUpload& part) -> ErrorOr<CompletedPart> {
        return ct::partFor(part);
    };

    uploader->start();

    EXPECT_EQ(uploader->state(), US_COMPLETED);
    EXPECT_EQ(mClient.uploads(0), 1u);
    EXPECT_EQ(mClient.uploads(10), 2u);
    EXPECT_EQ(mClient.commits().size(), 1u);
}

TEST_F(ChunkedUploaderTest, retries_are_bounded)
{
    mOptions.mRetryPolicy.mMaxAttempts = 3;

    mClient.mPartHandler = [](const PartUpload& part) -> ErrorOr<CompletedPart> {
        if (part.mOffset == 20)
            return unexpected(Error(API_ETEMPUNAVAIL, 503));

        return ct::partFor(part);
    };

    auto uploader = create(ct::makeContent(36));

    uploader->start();

    ASSERT_TRUE(mEvents.waitFor<PartFailed>(1));

    EXPECT_EQ(mClient.uploads(20), 3u);
    EXPECT_EQ(uploader->count(PS_FAILED), 1u);
    EXPECT_EQ(uploader->state(), US_UPLOADING);

    auto events = mEvents.events();
    auto failed = std::find_if(events.begin(), events.end(), [](const UploadEvent& event) {
        return std::holds_alternative<PartFailed>(event);
    });

    ASSERT_NE(failed, events.end());
    EXPECT_EQ(std::get<PartFailed>(*failed).mAttempts, 3u);
}

TEST_F(ChunkedUploaderTest, start_is_idempotent)
{
    mClient.mDeferUploads = true;
    mOptions.mParallelism = 2;

    auto uploader = create(ct::makeContent(36));

    // Racing starts.
    std::thread other([&]() { uploader->start(); });

    uploader->start();
    other.join();

    // Sequential start.
    uploader->start();

    EXPECT_EQ(mClient.uploads().size(), 2u);
    EXPECT_EQ(mClient.uploads(0), 1u);
    EXPECT_EQ(mClient.uploads(10), 1u);

    for (auto offset : {0, 10, 20, 30})
    {
        ASSERT_TRUE(mClient.waitForDeferredUploads(1));
        EXPECT_TRUE(mClient.completeUpload(offset));
    }

    EXPECT_EQ(uploader->state(), US_COMPLETED);
    EXPECT_EQ(mClient.uploads().size(), 4u);
}

TEST_F(ChunkedUploaderTest, stream_matches_fixed_upload)
{
    auto content = ct::makeContent(45);

    auto fixed = create(content);

    fixed->start();

    ASSERT_EQ(fixed->state(), US_COMPLETED);

    auto stream = std::make_shared<PipeByteStream>();

    // Only some of the content is available at first.
    stream->write(content.substr(0, 7));
    stream->write(content.substr(7, 8));

    auto streamed = create(UploadSource::fromStream(stream), 45);

    EXPECT_TRUE(stream->paused());

    streamed->start();

    EXPECT_EQ(streamed->state(), US_UPLOADING);
    EXPECT_EQ(mClient.uploads().size(), 6u);

    // The rest arrives later, in odd sized chunks.
    stream->write(content.substr(15, 3));
    stream->write(content.substr(18, 20));
    stream->write(content.substr(38));
    stream->close();

    auto result = streamed->result();

    ASSERT_TRUE(ready(result));
    ASSERT_TRUE(result.get());

    auto commits = mClient.commits();

    ASSERT_EQ(commits.size(), 2u);
    EXPECT_EQ(commits[0].mDigest, commits[1].mDigest);
    EXPECT_THAT(offsets(commits[1].mRequest), ElementsAre(0, 10, 20, 30, 40));

    auto uploads = mClient.uploads();

    ASSERT_EQ(uploads.size(), 10u);

    // Uploads may be issued in any order.
    std::map<m_off_t, std::string> fixedParts;
    std::map<m_off_t, std::string> streamedParts;

    for (std::size_t i = 0; i < 5; ++i)
    {
        fixedParts[uploads[i].mOffset] = *uploads[i].mData;
        streamedParts[uploads[i + 5].mOffset] = *uploads[i + 5].mData;
    }

    EXPECT_EQ(fixedParts, streamedParts);
    EXPECT_EQ(fixedParts.size(), 5u);
}

TEST_F(ChunkedUploaderTest, stream_shorter_than_declared)
{
    auto stream = std::make_shared<PipeByteStream>();

    stream->write(ct::makeContent(25));
    stream->close();

    auto uploader = create(UploadSource::fromStream(stream), 36);

    uploader->start();

    EXPECT_EQ(uploader->state(), US_UPLOADING);
    EXPECT_EQ(uploader->count(PS_COMPLETED), 2u);
    EXPECT_EQ(uploader->count(PS_FAILED), 1u);

    ASSERT_EQ(mEvents.count<PartFailed>(), 1u);

    for (auto& event : mEvents.events())
    {
        if (auto* failed = std::get_if<PartFailed>(&event))
            EXPECT_EQ(failed->mError, API_EREAD);
    }

    EXPECT_TRUE(mClient.commits().empty());
}

TEST_F(ChunkedUploaderTest, transient_failure_is_retried)
{
    std::atomic<unsigned int> failures{0};

    mClient.mPartHandler = [&failures](const PartUpload& part) -> ErrorOr<CompletedPart> {
        if (part.mOffset == 10 && failures++ < 2)
            return unexpected(LOCAL_ETIMEOUT);

        return ct::partFor(part);
    };

    mOptions.mPartTimeout = std::chrono::milliseconds(250);

    auto uploader = create(ct::makeContent(36));

    uploader->start();

    auto result = uploader->result();

    ASSERT_TRUE(ready(result));
    ASSERT_TRUE(result.get());

    EXPECT_EQ(mClient.uploads(10), 3u);
    EXPECT_EQ(mEvents.count<PartFailed>(), 0u);
    EXPECT_EQ(mEvents.count<PartUploaded>(), 4u);

    for (auto& upload : mClient.uploads())
        EXPECT_EQ(upload.mTimeout, std::chrono::milliseconds(250));
}
