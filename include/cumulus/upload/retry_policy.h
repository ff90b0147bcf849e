#pragma once

#include <cumulus/common/deciseconds.h>
#include <cumulus/types.h>

#include <memory>

namespace cumulus
{

class BackoffTimer;
class PrnGen;

namespace upload
{

// Controls how failed part uploads are retried.
struct RetryPolicy
{
    // Instantiate a timer that backs off according to this policy.
    std::unique_ptr<BackoffTimer> timer(PrnGen& rng) const;

    // Can the part be attempted again after this many attempts?
    bool exhausted(unsigned int attempts) const;

    // How many times will a part be attempted, including the first?
    unsigned int mMaxAttempts = 5;

    // How long do we wait before the first retry?
    common::deciseconds mInitialDelay = common::deciseconds(10);

    // Delays double after every retry but never exceed this.
    common::deciseconds mMaximumDelay = common::deciseconds(300);
}; // RetryPolicy

// Is the error transient and thus worth retrying?
//
// Timeouts, rate limiting, temporary unavailability and transport
// failures are transient, as is any HTTP 429 or 5xx response.
bool retryable(const Error& error);

} // upload
} // cumulus
