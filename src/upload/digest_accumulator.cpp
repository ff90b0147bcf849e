#include <cumulus/base64.h>
#include <cumulus/common/logging.h>
#include <cumulus/upload/digest_accumulator.h>
#include <cumulus/upload/logger.h>

namespace cumulus
{
namespace upload
{

DigestAccumulator::DigestAccumulator()
  : mHash(std::make_unique<HashSHA1>())
  , mOffset(0)
{
}

Error DigestAccumulator::add(m_off_t offset, const std::string& data)
{
    // Data must be contiguous.
    if (offset != mOffset)
    {
        LogWarningF(logger(),
                    "Non-contiguous digest input: expected offset %lld, got %lld",
                    static_cast<long long>(mOffset),
                    static_cast<long long>(offset));

        return API_EARGS;
    }

    mHash->add(reinterpret_cast<const byte*>(data.data()), data.size());

    mOffset += static_cast<m_off_t>(data.size());

    return API_OK;
}

std::string DigestAccumulator::finalize()
{
    std::string digest;

    mHash->get(&digest);

    reset();

    return Base64::btoa(digest);
}

m_off_t DigestAccumulator::offset() const
{
    return mOffset;
}

void DigestAccumulator::reset()
{
    mHash = std::make_unique<HashSHA1>();
    mOffset = 0;
}

} // upload
} // cumulus
