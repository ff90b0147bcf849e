#pragma once

#include <cumulus/common/error_or_forward.h>
#include <cumulus/types.h>

#include <cstddef>
#include <string>
#include <vector>

namespace cumulus
{

struct JSON;
class JSONWriter;

namespace upload
{

// A byte range of the source that has yet to be confirmed by the service.
struct PendingPart
{
    // Where does this part begin?
    m_off_t mOffset = 0;

    // How many bytes does it contain?
    m_off_t mSize = 0;

    bool operator==(const PendingPart& rhs) const
    {
        return mOffset == rhs.mOffset && mSize == rhs.mSize;
    }
}; // PendingPart

// A part the service has accepted.
struct CompletedPart
{
    // Parses a "part" object, the scanner is positioned after its opening brace.
    static common::ErrorOr<CompletedPart> fromJSON(JSON& reader);

    // Writes the part as an element of the commit request's part list.
    void toJSON(JSONWriter& writer) const;

    std::string mPartID;
    m_off_t mOffset = 0;
    m_off_t mSize = 0;

    // Base64 encoded SHA-1 of the part's content.
    std::string mSHA1;
}; // CompletedPart

using CompletedPartVector = std::vector<CompletedPart>;
using PendingPartVector = std::vector<PendingPart>;

enum PartState : unsigned int
{
    PS_PENDING,
    PS_IN_FLIGHT,
    PS_COMPLETED,
    PS_FAILED
}; // PartState

const char* toString(PartState state);

// Splits [0, totalSize) into contiguous parts of partSize bytes.
//
// Every part but the last is exactly partSize bytes long. The last part
// holds the remainder, or partSize bytes if totalSize is a multiple of
// partSize. An empty range yields no parts.
//
// Throws if totalSize is negative or partSize isn't positive.
PendingPartVector partition(m_off_t totalSize, m_off_t partSize);

} // upload
} // cumulus
