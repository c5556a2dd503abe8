//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_ASYNC_POLLING_POLICY_HPP
#define TURNSTILE_ASYNC_POLLING_POLICY_HPP

#include <turnstile/config.hpp>
//
#include <turnstile/int_types.hpp>

#include <algorithm>
#include <ostream>

namespace tstile {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// State variables passed into `update_poll_state` along with a PollingPolicy object in order to update the
// delay between poll attempts.
//
struct PollState {
    u64 n_polls = 0;
    u64 prev_delay_usec = 0;
    u64 next_delay_usec = 0;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Controls how long a wait loop sleeps between unsuccessful polls: simple exponential backoff with no
// jitter.  There is no limit on the number of polls; the wait deadline (if any) bounds the loop.
//
struct PollingPolicy {
    // How long to wait after the first unsuccessful poll.
    //
    u64 initial_delay_usec;

    // How much to increase after each unsuccessful poll:
    //   next_delay = prev_delay * backoff_factor / backoff_divisor.
    //
    u64 backoff_factor;
    u64 backoff_divisor;

    // The maximum delay.
    //
    u64 max_delay_usec;

    //==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

    static PollingPolicy with_default_params()
    {
        PollingPolicy p;

        p.initial_delay_usec = 10 * 1000;  // 10ms
        p.backoff_factor = 2;
        p.backoff_divisor = 1;
        p.max_delay_usec = 1000 * 1000;  // 1s

        return p;
    }

    // Poll at a constant rate.
    //
    static PollingPolicy fixed_interval(u64 delay_usec)
    {
        PollingPolicy p;

        p.initial_delay_usec = delay_usec;
        p.backoff_factor = 1;
        p.backoff_divisor = 1;
        p.max_delay_usec = delay_usec;

        return p;
    }
};

inline std::ostream& operator<<(std::ostream& out, const PollingPolicy& t)
{
    return out << "PollingPolicy{.initial_delay_usec=" << t.initial_delay_usec
               << ", .backoff_factor=" << t.backoff_factor << ", .backoff_divisor=" << t.backoff_divisor
               << ", .max_delay_usec=" << t.max_delay_usec << ",}";
}

// Increase the delay interval by the constant factor specified in `policy`, up to
// `PollingPolicy::max_delay_usec`.
//
inline void update_poll_state(PollState& state, const PollingPolicy& policy)
{
    state.n_polls += 1;
    state.prev_delay_usec = state.next_delay_usec;
    if (state.n_polls == 1) {
        state.next_delay_usec = std::min(policy.max_delay_usec, policy.initial_delay_usec);
    } else {
        state.next_delay_usec = std::min(
            policy.max_delay_usec, state.prev_delay_usec * policy.backoff_factor / policy.backoff_divisor);
    }
}

}  // namespace tstile

#endif  // TURNSTILE_ASYNC_POLLING_POLICY_HPP
