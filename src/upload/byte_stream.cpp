#include <cumulus/common/error_or.h>
#include <cumulus/common/logging.h>
#include <cumulus/upload/byte_stream.h>
#include <cumulus/upload/logger.h>

namespace cumulus
{
namespace upload
{

void PipeByteStream::close()
{
    std::lock_guard<std::mutex> guard(mLock);

    mEnded = true;
}

bool PipeByteStream::ended() const
{
    std::lock_guard<std::mutex> guard(mLock);

    // Data written before the pipe was closed must still be pulled.
    return mEnded && mChunks.empty();
}

void PipeByteStream::fail()
{
    std::lock_guard<std::mutex> guard(mLock);

    mFailed = true;
}

void PipeByteStream::pause()
{
    std::lock_guard<std::mutex> guard(mLock);

    mPaused = true;
}

bool PipeByteStream::paused() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mPaused;
}

common::ErrorOr<std::string> PipeByteStream::pull()
{
    std::lock_guard<std::mutex> guard(mLock);

    if (mFailed)
        return common::unexpected(API_EREAD);

    std::string data;

    while (!mChunks.empty())
    {
        data.append(mChunks.front());
        mChunks.pop_front();
    }

    return data;
}

void PipeByteStream::write(std::string chunk)
{
    std::lock_guard<std::mutex> guard(mLock);

    // Sanity.
    if (mEnded)
        throw LogError1(logger(), "Can't write to a closed pipe");

    if (!chunk.empty())
        mChunks.emplace_back(std::move(chunk));
}

IStreamByteStream::IStreamByteStream(std::unique_ptr<std::istream> stream,
                                     std::size_t chunkSize)
  : mStream(std::move(stream))
  , mChunkSize(chunkSize)
{
    if (!mStream)
        throw LogError1(logger(), "Null input stream");

    if (!mChunkSize)
        throw LogError1(logger(), "Chunk size must be positive");
}

bool IStreamByteStream::ended() const
{
    return mEnded;
}

void IStreamByteStream::pause()
{
    // We only ever read when pulled.
}

common::ErrorOr<std::string> IStreamByteStream::pull()
{
    if (mEnded)
        return std::string();

    std::string data(mChunkSize, '\0');

    mStream->read(&data[0], static_cast<std::streamsize>(data.size()));

    if (mStream->bad())
    {
        LogWarning1(logger(), "Unable to read from input stream");

        return common::unexpected(API_EREAD);
    }

    data.resize(static_cast<std::size_t>(mStream->gcount()));

    if (mStream->eof())
        mEnded = true;

    return data;
}

} // upload
} // cumulus
