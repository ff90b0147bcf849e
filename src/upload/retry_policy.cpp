#include <cumulus/backofftimer.h>
#include <cumulus/crypto/cryptopp.h>
#include <cumulus/upload/retry_policy.h>

namespace cumulus
{
namespace upload
{

std::unique_ptr<BackoffTimer> RetryPolicy::timer(PrnGen& rng) const
{
    return std::make_unique<BackoffTimer>(rng,
                                          mInitialDelay.count(),
                                          mMaximumDelay.count());
}

bool RetryPolicy::exhausted(unsigned int attempts) const
{
    return attempts >= mMaxAttempts;
}

bool retryable(const Error& e)
{
    auto code = static_cast<ErrorCodes>(e);

    switch (code)
    {
    case API_EAGAIN:
    case API_ERATELIMIT:
    case API_ETEMPUNAVAIL:
    case LOCAL_ETIMEOUT:
        return true;
    case API_EARGS:
    case API_EREAD:
    case LOCAL_ABANDONED:
        return false;
    default:
        break;
    }

    // Failures that never reached the service.
    if (!e.hasHttpStatus())
        return true;

    auto status = e.getHttpStatus();

    return status == 429 || status >= 500;
}

} // upload
} // cumulus
