#pragma once

#include <cumulus/upload/retry_policy.h>

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

namespace cumulus
{
namespace upload
{

struct ChunkedUploadOptions
{
    // How many parts may be uploaded at once?
    std::size_t mParallelism = 4;

    // How are failed parts retried?
    RetryPolicy mRetryPolicy;

    // Sent along with the commit request as the file's attributes.
    std::map<std::string, std::string> mFileAttributes;

    // How long may a single part upload take? Zero means forever.
    std::chrono::milliseconds mPartTimeout = std::chrono::milliseconds(0);

    // How long do we wait before asking a stalled stream for more data?
    std::chrono::milliseconds mStreamPollInterval = std::chrono::milliseconds(10);
}; // ChunkedUploadOptions

} // upload
} // cumulus
