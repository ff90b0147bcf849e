#pragma once

#include <cumulus/common/error_or_forward.h>
#include <cumulus/upload/byte_stream.h>
#include <cumulus/types.h>

#include <memory>
#include <string>
#include <variant>

namespace cumulus
{
namespace upload
{

// The requested bytes aren't available yet, ask again later.
struct NotReady
{
}; // NotReady

// The requested bytes.
//
// The data may be shorter than requested if the source has been exhausted.
struct Ready
{
    std::shared_ptr<const std::string> mData;
}; // Ready

using ReadResult = std::variant<NotReady, Ready>;

// Presents fixed content and streams through one interface.
class UploadSource
{
    // Content that is entirely in memory.
    struct FixedBytes
    {
        std::shared_ptr<const std::string> mBytes;
    }; // FixedBytes

    // Content that arrives over time.
    struct StreamingReader
    {
        // Data pulled from the stream but not yet read.
        std::string mBuffer;

        // The offset of the first byte in mBuffer.
        m_off_t mOffset = 0;

        ByteStreamPtr mStream;
    }; // StreamingReader

    // Source has been released.
    struct Released
    {
    }; // Released

    using Variant = std::variant<Released, FixedBytes, StreamingReader>;

    common::ErrorOr<ReadResult> read(FixedBytes& source,
                                     m_off_t offset,
                                     m_off_t length);

    common::ErrorOr<ReadResult> read(StreamingReader& source,
                                     m_off_t offset,
                                     m_off_t length);

    Variant mSource;

    explicit UploadSource(Variant source);

public:
    UploadSource(UploadSource&& other) = default;

    UploadSource& operator=(UploadSource&& rhs) = default;

    // Content held in memory.
    static UploadSource fromBytes(std::string bytes);

    // Content produced by a stream, which is paused right away.
    //
    // Throws if stream is null.
    static UploadSource fromStream(ByteStreamPtr stream);

    // How many bytes have been pulled from a stream but not yet read?
    m_off_t buffered() const;

    // Retrieve length bytes starting at offset.
    //
    // Fixed content is always ready. Streams must be read sequentially:
    // reading any offset other than the next unread one yields
    // API_EARGS. A stream is ready when it has buffered length bytes or
    // when it has ended, in which case the data may be short.
    common::ErrorOr<ReadResult> read(m_off_t offset, m_off_t length);

    // Drop any buffered data and our reference to the underlying source.
    void release();

    // Has the source been released?
    bool released() const;

    // Does the content come from a stream?
    bool streaming() const;

    // How many bytes does fixed content hold? Streams report -1.
    m_off_t size() const;
}; // UploadSource

} // upload
} // cumulus
