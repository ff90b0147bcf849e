/**
 * @file backofftimer.cpp
 * @brief Generic timer facility with exponential backoff
 *
 * (c) 2026 by the Cumulus SDK authors
 *
 * This file is part of the Cumulus SDK - Client Access Engine.
 *
 * The Cumulus SDK is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * @copyright Simplified (2-clause) BSD License.
 *
 * You should have received a copy of the license along with this
 * program.
 */


#include "cumulus/backofftimer.h"

#include <algorithm>
#include <chrono>

#include "cumulus/common/deciseconds.h"
#include "cumulus/crypto/cryptopp.h"

namespace cumulus {

dstime BackoffTimer::now()
{
    using std::chrono::duration_cast;
    using std::chrono::steady_clock;

    auto elapsed = steady_clock::now().time_since_epoch();

    return duration_cast<common::deciseconds>(elapsed).count();
}

// timer with capped exponential backoff
BackoffTimer::BackoffTimer(PrnGen &rng, dstime initialDelay, dstime maximumDelay)
    : initial(std::max<dstime>(initialDelay, 0))
    , maximum(std::max(maximumDelay, std::max<dstime>(initialDelay, 0)))
    , rng(rng)
{
    reset();
}

void BackoffTimer::reset()
{
    next = 0;
    delta = initial;
    base = initial;
}

void BackoffTimer::backoff()
{
    next = now() + delta;

    base <<= 1;

    if (base > maximum)
    {
        base = maximum;
    }

    // up to 50% jitter on top of the base delay
    dstime jitter = 0;

    if (base > 1)
    {
        jitter = static_cast<dstime>(rng.genuint32(static_cast<uint64_t>(base / 2 + 1)));
    }

    delta = std::min(base + jitter, maximum);
}

void BackoffTimer::backoff(dstime newdelta)
{
    next = (newdelta == NEVER) ? NEVER : (now() + newdelta);
    delta = newdelta;
    base = newdelta;
}

bool BackoffTimer::armed() const
{
    return next != NEVER && now() >= next;
}

dstime BackoffTimer::retryin() const
{
    if (next == NEVER)
    {
        return NEVER;
    }

    if (armed())
    {
        return 0;
    }

    return next - now();
}

dstime BackoffTimer::backoffdelta() const
{
    return delta;
}

dstime BackoffTimer::nextset() const
{
    return next;
}

} // namespace
