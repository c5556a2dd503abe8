//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_ASYNC_POLLING_WAIT_LOOP_HPP
#define TURNSTILE_ASYNC_POLLING_WAIT_LOOP_HPP

#include <turnstile/config.hpp>
//
#include <turnstile/async/polling_policy.hpp>
#include <turnstile/async/wait_loop.hpp>

#include <turnstile/logging.hpp>
#include <turnstile/optional.hpp>
#include <turnstile/status.hpp>

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

namespace tstile {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// The default clock implementation for BasicPollingWaitLoop.
//
struct SystemClockImpl {
    WaitLoop::TimePoint operator()() const
    {
        return boost::posix_time::microsec_clock::universal_time();
    }
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// The default sleep implementation for BasicPollingWaitLoop.
//
struct ThreadSleepImpl {
    void operator()(const WaitLoop::Duration& duration) const
    {
        if (duration.is_negative()) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::microseconds(duration.total_microseconds()));
    }
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// A WaitLoop that polls, sleeping between attempts according to a PollingPolicy.
//
// `ClockImpl` must be callable as `TimePoint()`; `SleepImpl` as `void(const Duration&)`.  Substitute both
// (see FakeClock) to run waits in virtual time.
//
template <typename ClockImpl, typename SleepImpl>
class BasicPollingWaitLoop : public WaitLoop
{
   public:
    explicit BasicPollingWaitLoop(const PollingPolicy& policy = PollingPolicy::with_default_params(),
                                  ClockImpl&& clock_impl = {}, SleepImpl&& sleep_impl = {}) noexcept
        : policy_(policy)
        , clock_impl_(std::move(clock_impl))
        , sleep_impl_(std::move(sleep_impl))
    {
    }

    const PollingPolicy& policy() const
    {
        return this->policy_;
    }

    Status run_until(const StepFn& step_fn, const Optional<Duration>& timeout,
                     std::string_view waiting_for) override
    {
        Optional<TimePoint> deadline;
        if (timeout) {
            deadline.emplace(this->clock_impl_() + *timeout);
        }

        PollState state;
        for (;;) {
            StatusOr<bool> done = step_fn();
            TSTILE_REQUIRE_OK(done);

            if (*done) {
                return OkStatus();
            }

            const TimePoint now = this->clock_impl_();
            if (deadline && now >= *deadline) {
                TSTILE_VLOG(1) << "Timeout of " << *timeout << " expired waiting for " << waiting_for
                               << " (" << (state.n_polls + 1) << " polls)";
                return Status{StatusCode::kDeadlineExceeded};
            }

            update_poll_state(state, this->policy_);

            Duration delay = boost::posix_time::microseconds(state.next_delay_usec);
            if (deadline) {
                delay = std::min(delay, *deadline - now);
            }

            TSTILE_VLOG(2) << "still waiting for " << waiting_for << "; sleeping " << delay << " (poll "
                           << state.n_polls << ")";

            this->sleep_impl_(delay);
        }
    }

   private:
    const PollingPolicy policy_;
    ClockImpl clock_impl_;
    SleepImpl sleep_impl_;
};

using PollingWaitLoop = BasicPollingWaitLoop<SystemClockImpl, ThreadSleepImpl>;

// The wait loop used by CompletionGate when none is specified.
//
inline WaitLoop& default_wait_loop()
{
    // Intentionally leaked to avoid any potential static deinit order issues.
    //
    static PollingWaitLoop* const instance_ = new PollingWaitLoop{};

    return *instance_;
}

}  // namespace tstile

#endif  // TURNSTILE_ASYNC_POLLING_WAIT_LOOP_HPP
