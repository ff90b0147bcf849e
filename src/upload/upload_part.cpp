#include <algorithm>

#include <cumulus/common/error_or.h>
#include <cumulus/common/logging.h>
#include <cumulus/json.h>
#include <cumulus/upload/logger.h>
#include <cumulus/upload/upload_part.h>

namespace cumulus
{
namespace upload
{

common::ErrorOr<CompletedPart> CompletedPart::fromJSON(JSON& reader)
{
    CompletedPart part;

    for (auto name = reader.getname(); !name.empty(); name = reader.getname())
    {
        if (name == "part_id")
        {
            if (!reader.storestring(part.mPartID))
                return common::unexpected(API_EINTERNAL);
        }
        else if (name == "offset")
            part.mOffset = reader.getint();
        else if (name == "size")
            part.mSize = reader.getint();
        else if (name == "sha1")
        {
            if (!reader.storestring(part.mSHA1))
                return common::unexpected(API_EINTERNAL);
        }
        else if (!reader.storeobject())
            return common::unexpected(API_EINTERNAL);
    }

    if (!reader.leaveobject())
        return common::unexpected(API_EINTERNAL);

    // The service must identify the part.
    if (part.mPartID.empty() || part.mOffset < 0 || part.mSize < 0)
    {
        LogWarning1(logger(), "Received a malformed part description");

        return common::unexpected(API_EINTERNAL);
    }

    return part;
}

void CompletedPart::toJSON(JSONWriter& writer) const
{
    writer.beginobject();
    writer.arg_stringWithEscapes("part_id", mPartID);
    writer.arg("offset", mOffset);
    writer.arg("size", mSize);
    writer.arg_stringWithEscapes("sha1", mSHA1);
    writer.endobject();
}

const char* toString(PartState state)
{
    switch (state)
    {
    case PS_PENDING:
        return "PENDING";
    case PS_IN_FLIGHT:
        return "IN_FLIGHT";
    case PS_COMPLETED:
        return "COMPLETED";
    case PS_FAILED:
        return "FAILED";
    }

    return "UNKNOWN";
}

PendingPartVector partition(m_off_t totalSize, m_off_t partSize)
{
    if (partSize <= 0)
        throw LogErrorF(logger(), "Invalid part size: %lld", static_cast<long long>(partSize));

    if (totalSize < 0)
        throw LogErrorF(logger(), "Invalid total size: %lld", static_cast<long long>(totalSize));

    PendingPartVector parts;

    parts.reserve(static_cast<std::size_t>((totalSize + partSize - 1) / partSize));

    for (m_off_t offset = 0; offset < totalSize; offset += partSize)
        parts.push_back({offset, std::min(partSize, totalSize - offset)});

    return parts;
}

} // upload
} // cumulus
