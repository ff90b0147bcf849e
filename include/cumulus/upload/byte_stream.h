#pragma once

#include <cumulus/common/error_or_forward.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <istream>
#include <memory>
#include <mutex>
#include <string>

namespace cumulus
{
namespace upload
{

// A source of bytes that produces data at its own pace.
//
// Implementations must never block in pull().
class ByteStream
{
public:
    virtual ~ByteStream() = default;

    // Has the stream produced all of its data?
    virtual bool ended() const = 0;

    // Stop producing data until someone pulls.
    virtual void pause() = 0;

    // Retrieve whatever data is available right now.
    //
    // Returns an empty string if nothing is currently available.
    virtual common::ErrorOr<std::string> pull() = 0;
}; // ByteStream

using ByteStreamPtr = std::shared_ptr<ByteStream>;

// A stream fed by some other party, possibly from another thread.
class PipeByteStream
  : public ByteStream
{
    // Chunks that have been written but not yet pulled.
    std::deque<std::string> mChunks;

    // Has the writer closed the pipe?
    bool mEnded = false;

    // Did the writer fail?
    bool mFailed = false;

    // Has the reader paused us?
    bool mPaused = false;

    mutable std::mutex mLock;

public:
    // Signal that no more data will be written.
    void close();

    bool ended() const override;

    // Signal that the writer has failed.
    void fail();

    void pause() override;

    bool paused() const;

    common::ErrorOr<std::string> pull() override;

    // Queue a chunk of data for the reader.
    void write(std::string chunk);
}; // PipeByteStream

// Adapts a standard input stream, a bounded amount is read per pull.
class IStreamByteStream
  : public ByteStream
{
    std::unique_ptr<std::istream> mStream;

    std::size_t mChunkSize;

    bool mEnded = false;

public:
    IStreamByteStream(std::unique_ptr<std::istream> stream,
                      std::size_t chunkSize);

    bool ended() const override;

    void pause() override;

    common::ErrorOr<std::string> pull() override;
}; // IStreamByteStream

} // upload
} // cumulus
