/**
 * @file cumulus/backofftimer.h
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


#ifndef CUMULUS_BACKOFF_TIMER_H
#define CUMULUS_BACKOFF_TIMER_H 1

#include "types.h"

namespace cumulus {

class PrnGen;

// generic timer facility with capped exponential backoff and jitter
class CUMULUS_API BackoffTimer
{
    dstime next;
    dstime delta;
    dstime base;
    dstime initial;
    dstime maximum;
    PrnGen &rng;

public:
    // monotonic time in deciseconds
    static dstime now();

    // reset timer
    void reset();

    // trigger exponential backoff
    void backoff();

    // set absolute backoff
    void backoff(dstime);

    // check if timer has elapsed
    bool armed() const;

    // time left for event to become armed
    dstime retryin() const;

    // delay that the next backoff() will wait
    dstime backoffdelta() const;

    // time of next trigger or 0 if no trigger since last reset
    dstime nextset() const;

    // initialDelay is the first wait, later waits double up to maximumDelay
    BackoffTimer(PrnGen &rng, dstime initialDelay = 1, dstime maximumDelay = 6000);
};

} // namespace

#endif
