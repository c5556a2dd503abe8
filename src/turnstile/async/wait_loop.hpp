//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_ASYNC_WAIT_LOOP_HPP
#define TURNSTILE_ASYNC_WAIT_LOOP_HPP

#include <turnstile/config.hpp>
//
#include <turnstile/optional.hpp>
#include <turnstile/status.hpp>

TSTILE_SUPPRESS_IF_GCC("-Wswitch-enum")
#include <boost/date_time/posix_time/posix_time.hpp>
TSTILE_UNSUPPRESS_IF_GCC()

#include <functional>
#include <string_view>

namespace tstile {

/** \brief Blocks the caller until a step function reports success, an error, or a deadline passes.
 *
 * This is the service CompletionGate::wait delegates to; it owns the deadline and the sleep/backoff
 * policy between attempts.  The default implementation is PollingWaitLoop.
 */
class WaitLoop
{
   public:
    using Duration = boost::posix_time::time_duration;
    using TimePoint = boost::posix_time::ptime;

    /** \brief Invoked once per attempt; true means done.
     */
    using StepFn = std::function<StatusOr<bool>()>;

    WaitLoop(const WaitLoop&) = delete;
    WaitLoop& operator=(const WaitLoop&) = delete;

    virtual ~WaitLoop() = default;

    /** \brief Invokes `step_fn` repeatedly until it yields true.
     *
     * \param timeout How long to keep trying; None means no limit.  Zero or negative values still allow a
     * single attempt.
     * \param waiting_for Human-readable description of the awaited condition, for diagnostics only.
     *
     * \return OkStatus() when `step_fn` yields true; the error status from `step_fn` (unchanged) if it
     * fails; StatusCode::kDeadlineExceeded if `timeout` elapses first.
     */
    virtual Status run_until(const StepFn& step_fn, const Optional<Duration>& timeout,
                             std::string_view waiting_for) = 0;

   protected:
    WaitLoop() = default;
};

}  // namespace tstile

#endif  // TURNSTILE_ASYNC_WAIT_LOOP_HPP
