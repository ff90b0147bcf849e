#include <algorithm>

#include <cumulus/common/error_or.h>
#include <cumulus/common/logging.h>
#include <cumulus/upload/logger.h>
#include <cumulus/upload/upload_source.h>

namespace cumulus
{
namespace upload
{

common::ErrorOr<ReadResult> UploadSource::read(FixedBytes& source,
                                               m_off_t offset,
                                               m_off_t length)
{
    auto& bytes = *source.mBytes;
    auto size = static_cast<m_off_t>(bytes.size());

    // Reads past the end are short, not errors.
    offset = std::min(offset, size);
    length = std::min(length, size - offset);

    auto data = std::make_shared<const std::string>(bytes,
                                                    static_cast<std::size_t>(offset),
                                                    static_cast<std::size_t>(length));

    return ReadResult(Ready{std::move(data)});
}

common::ErrorOr<ReadResult> UploadSource::read(StreamingReader& source,
                                               m_off_t offset,
                                               m_off_t length)
{
    // Streams can only be read sequentially.
    if (offset != source.mOffset)
    {
        LogWarningF(logger(),
                    "Out of order stream read: expected offset %lld, got %lld",
                    static_cast<long long>(source.mOffset),
                    static_cast<long long>(offset));

        return common::unexpected(API_EARGS);
    }

    auto& buffer = source.mBuffer;
    auto wanted = static_cast<std::size_t>(length);

    // Pull only as much as we need.
    while (buffer.size() < wanted)
    {
        auto chunk = source.mStream->pull();

        if (!chunk)
        {
            LogWarningF(logger(),
                        "Unable to pull from stream at offset %lld",
                        static_cast<long long>(offset + static_cast<m_off_t>(buffer.size())));

            return common::unexpected(API_EREAD);
        }

        // Nothing available right now.
        if (chunk->empty())
            break;

        buffer.append(*chunk);
    }

    // Come back later.
    if (buffer.size() < wanted && !source.mStream->ended())
        return ReadResult(NotReady());

    auto count = std::min(wanted, buffer.size());
    auto data = std::make_shared<const std::string>(buffer, 0, count);

    buffer.erase(0, count);

    source.mOffset += static_cast<m_off_t>(count);

    return ReadResult(Ready{std::move(data)});
}

UploadSource::UploadSource(Variant source)
  : mSource(std::move(source))
{
}

UploadSource UploadSource::fromBytes(std::string bytes)
{
    return UploadSource(FixedBytes{std::make_shared<const std::string>(std::move(bytes))});
}

UploadSource UploadSource::fromStream(ByteStreamPtr stream)
{
    if (!stream)
        throw LogError1(logger(), "Upload source must be either bytes or a stream");

    // The stream shouldn't produce anything until we ask it to.
    stream->pause();

    return UploadSource(StreamingReader{std::string(), 0, std::move(stream)});
}

m_off_t UploadSource::buffered() const
{
    if (auto* reader = std::get_if<StreamingReader>(&mSource))
        return static_cast<m_off_t>(reader->mBuffer.size());

    return 0;
}

common::ErrorOr<ReadResult> UploadSource::read(m_off_t offset, m_off_t length)
{
    if (offset < 0 || length < 0)
        return common::unexpected(API_EARGS);

    if (auto* bytes = std::get_if<FixedBytes>(&mSource))
        return read(*bytes, offset, length);

    if (auto* reader = std::get_if<StreamingReader>(&mSource))
        return read(*reader, offset, length);

    // Source has been released.
    return common::unexpected(API_EREAD);
}

void UploadSource::release()
{
    mSource = Released();
}

bool UploadSource::released() const
{
    return std::holds_alternative<Released>(mSource);
}

bool UploadSource::streaming() const
{
    return std::holds_alternative<StreamingReader>(mSource);
}

m_off_t UploadSource::size() const
{
    if (auto* bytes = std::get_if<FixedBytes>(&mSource))
        return static_cast<m_off_t>(bytes->mBytes->size());

    return -1;
}

} // upload
} // cumulus
