//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_ASYNC_COMPLETION_GATE_IMPL_HPP
#define TURNSTILE_ASYNC_COMPLETION_GATE_IMPL_HPP

#include <turnstile/config.hpp>
//
#include <turnstile/logging.hpp>
#include <turnstile/utility.hpp>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception_ptr.hpp>

#include <exception>
#include <string>

namespace tstile {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL CompletionGate::CompletionGate(WaitLoop& wait_loop) noexcept : wait_loop_{&wait_loop}
{
    TSTILE_VLOG(2) << "CompletionGate created: " << (void*)this;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL StatusOr<bool> CompletionGate::poll()
{
    if (this->finished_) {
        return true;
    }

    // Index-based so that a callback may append to the registry while it runs.
    //
    for (usize i = 0; i < this->during_callbacks_.size(); ++i) {
        TSTILE_REQUIRE_OK(this->during_callbacks_[i]());
    }

    this->finished_ = this->is_condition_met();

    if (this->finished_ && this->fire_state_.fetch_or(kFired) == kPending) {
        TSTILE_REQUIRE_OK(this->run_then_callbacks());
    }

    return this->finished_;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL Status CompletionGate::run_then_callbacks()
{
    // Only the first failure is reported, whether it was returned or thrown.
    //
    Status first_error;
    std::exception_ptr first_exception;

    for (usize i = 0; i < this->then_callbacks_.size(); ++i) {
        try {
            Status result = this->then_callbacks_[i]();
            if (!result.ok()) {
                TSTILE_VLOG(1) << "then-callback #" << i << " of " << *this << " failed: " << result;
                if (!first_exception) {
                    first_error.Update(result);
                }
            }
        } catch (...) {
            TSTILE_VLOG(1) << "then-callback #" << i << " of " << *this << " threw: "
                           << boost::diagnostic_information(boost::current_exception());
            if (first_error.ok() && !first_exception) {
                first_exception = std::current_exception();
            }
        }
    }

    if (first_exception) {
        std::rethrow_exception(first_exception);
    }
    return first_error;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL Status CompletionGate::run_timeout_callbacks()
{
    for (usize i = 0; i < this->timeout_callbacks_.size(); ++i) {
        TSTILE_REQUIRE_OK(this->timeout_callbacks_[i]());
    }
    return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL Status CompletionGate::require_not_finished(const char* operation) const
{
    if (this->finished_) {
        TSTILE_VLOG(1) << operation << "() called on finished gate " << *this;
        return Status{StatusCode::kFailedPrecondition};
    }
    return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL GateChain CompletionGate::append_callback(std::deque<Callback>& registry,
                                                             Callback&& callback, const char* operation)
{
    Status status = this->require_not_finished(operation);
    if (status.ok()) {
        registry.emplace_back(std::move(callback));
    }
    return GateChain{*this, status};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL GateChain CompletionGate::set_default_timeout(const Duration& timeout)
{
    Status status = this->require_not_finished("set_default_timeout");
    if (status.ok()) {
        this->default_timeout_.emplace(timeout);
    }
    return GateChain{*this, status};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL GateChain CompletionGate::set_timeout_translator(TimeoutTranslator&& translator)
{
    Status status = this->require_not_finished("set_timeout_translator");
    if (status.ok()) {
        this->timeout_translator_ = std::move(translator);
    }
    return GateChain{*this, status};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL Status CompletionGate::wait(const Optional<Duration>& timeout)
{
    return this->wait(timeout, *this->wait_loop_);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL Status CompletionGate::wait(const Optional<Duration>& timeout, WaitLoop& wait_loop)
{
    const Optional<Duration> effective_timeout = timeout ? timeout : this->default_timeout_;
    const std::string waiting_for = to_string(*this);

    TSTILE_VLOG(1) << "waiting for " << waiting_for << " (timeout=" << effective_timeout << ")";

    // Exceptions from the predicate or from a callback are logged, then propagate unchanged.
    //
    try {
        return this->wait_until_done(effective_timeout, wait_loop, waiting_for);
    } catch (...) {
        TSTILE_VLOG(1) << "exception while waiting for " << waiting_for << ": "
                       << boost::diagnostic_information(boost::current_exception());
        throw;
    }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL Status CompletionGate::wait_until_done(const Optional<Duration>& timeout,
                                                          WaitLoop& wait_loop, const std::string& waiting_for)
{
    // Errors from `poll` must be passed through as-is, so remember whether the loop's status came from
    // the step function or from the loop's own deadline.
    //
    Optional<Status> step_error;

    const Status status = wait_loop.run_until(
        [this, &step_error]() -> StatusOr<bool> {
            StatusOr<bool> result = this->poll();
            if (!result.ok()) {
                step_error.emplace(result.status());
            }
            return result;
        },
        timeout, waiting_for);

    if (status.ok()) {
        TSTILE_VLOG(1) << "done waiting for " << waiting_for;
        return status;
    }

    if (step_error || status != Status{StatusCode::kDeadlineExceeded}) {
        TSTILE_VLOG(1) << "error while waiting for " << waiting_for << ": " << status;
        return status;
    }

    TSTILE_REQUIRE_OK(this->run_timeout_callbacks());

    if (this->timeout_translator_) {
        Optional<Status> translated = this->timeout_translator_(status);
        if (translated && !translated->ok()) {
            TSTILE_VLOG(1) << "timed out waiting for " << waiting_for << "; reporting " << *translated;
            return *translated;
        }
    }

    TSTILE_VLOG(1) << "timed out waiting for " << waiting_for;
    return status;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TSTILE_INLINE_IMPL std::ostream& operator<<(std::ostream& out, const CompletionGate& t)
{
    t.print(out);
    return out;
}

}  // namespace tstile

#endif  // TURNSTILE_ASYNC_COMPLETION_GATE_IMPL_HPP
