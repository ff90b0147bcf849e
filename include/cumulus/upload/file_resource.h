#pragma once

#include <cumulus/common/error_or_forward.h>
#include <cumulus/types.h>

#include <string>

namespace cumulus
{

struct JSON;

namespace upload
{

// Describes the file produced by a successful commit.
struct FileResource
{
    // Parses a file object, the scanner is positioned after its opening brace.
    static common::ErrorOr<FileResource> fromJSON(JSON& reader);

    std::string mType;
    std::string mID;
    std::string mETag;
    std::string mName;
    std::string mSHA1;
    std::string mParentID;
    m_off_t mSize = 0;
}; // FileResource

} // upload
} // cumulus
