//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_ASYNC_FAKE_CLOCK_HPP
#define TURNSTILE_ASYNC_FAKE_CLOCK_HPP

#include <turnstile/config.hpp>
//
#include <turnstile/async/polling_wait_loop.hpp>
#include <turnstile/async/wait_loop.hpp>

#include <turnstile/assert.hpp>
#include <turnstile/int_types.hpp>

namespace tstile {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// A clock that virtualizes the passage of time, to implement simulations and tests.  Time only moves
// when `advance` is called, or when a wait loop built with `FakeClock::SleepImpl` sleeps.
//
class FakeClock
{
   public:
    using TimePoint = WaitLoop::TimePoint;
    using Duration = WaitLoop::Duration;

    struct ClockImpl {
        FakeClock* clock;

        TimePoint operator()() const
        {
            return this->clock->now();
        }
    };

    struct SleepImpl {
        FakeClock* clock;

        void operator()(const Duration& duration) const
        {
            this->clock->sleep(duration);
        }
    };

    using WaitLoopType = BasicPollingWaitLoop<ClockImpl, SleepImpl>;

    //==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

    // Initialize the fake clock.  The initial value for `now` will be set to the current system time.
    //
    FakeClock() : fake_time_{boost::posix_time::microsec_clock::universal_time()}
    {
    }

    FakeClock(const FakeClock&) = delete;
    FakeClock& operator=(const FakeClock&) = delete;

    TimePoint now() const
    {
        return this->fake_time_;
    }

    // Move "fake time" ahead by the specified amount.
    //
    void advance(const Duration& delta)
    {
        TSTILE_CHECK(!delta.is_negative()) << "FakeClock can not go backwards!";
        this->fake_time_ += delta;
    }

    // Counts as a sleep, then advances the clock.
    //
    void sleep(const Duration& duration)
    {
        this->sleep_count_ += 1;
        if (!duration.is_negative()) {
            this->total_sleep_ += duration;
            this->advance(duration);
        }
    }

    usize sleep_count() const
    {
        return this->sleep_count_;
    }

    Duration total_sleep() const
    {
        return this->total_sleep_;
    }

    // Returns a wait loop that reads and advances this clock.
    //
    WaitLoopType make_wait_loop(const PollingPolicy& policy = PollingPolicy::with_default_params())
    {
        return WaitLoopType{policy, ClockImpl{this}, SleepImpl{this}};
    }

   private:
    TimePoint fake_time_;
    Duration total_sleep_{0, 0, 0};
    usize sleep_count_ = 0;
};

}  // namespace tstile

#endif  // TURNSTILE_ASYNC_FAKE_CLOCK_HPP
