//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_ASYNC_COMPLETION_GATE_DECL_HPP
#define TURNSTILE_ASYNC_COMPLETION_GATE_DECL_HPP

#include <turnstile/config.hpp>
//
#include <turnstile/async/polling_wait_loop.hpp>
#include <turnstile/async/wait_loop.hpp>

#include <turnstile/int_types.hpp>
#include <turnstile/optional.hpp>
#include <turnstile/status.hpp>
#include <turnstile/utility.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <ostream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace tstile {

namespace detail {

// Invokes `fn` with the bound arguments in `args`, mapping the result onto a Status: a `void` result means
// success; `Status` and `StatusOr<T>` results are converted with `to_status`.
//
template <typename Fn, typename ArgsTuple>
inline Status invoke_as_status(Fn& fn, ArgsTuple& args)
{
    using Result = decltype(std::apply(fn, args));

    if constexpr (std::is_void_v<Result>) {
        std::apply(fn, args);
        return OkStatus();
    } else {
        static_assert(std::is_same_v<std::decay_t<Result>, Status> || IsStatusOr<std::decay_t<Result>>{},
                      "CompletionGate callbacks must return void, Status, or StatusOr<T>");

        return to_status(std::apply(fn, args));
    }
}

}  // namespace detail

class GateChain;

/** \brief A condition that becomes true at some future point, discovered by polling.
 *
 * Derived classes supply the completion predicate (`is_condition_met`) and a human-readable description
 * (`print`).  Callers attach callbacks to run on completion (`then`), on every poll while not yet
 * finished (`during`), and when a wait times out (`on_timeout`), then block with `wait`.
 *
 * CompletionGate is designed for a single logical thread of control (which may be shared cooperatively by
 * many gates); it is not safe to call `poll` concurrently from multiple threads.
 */
class CompletionGate
{
   public:
    using Self = CompletionGate;
    using Duration = WaitLoop::Duration;

    /** \brief A registered callback, with its arguments already bound.
     */
    using Callback = std::function<Status()>;

    /** \brief Maps the DeadlineExceeded status from a timed-out wait onto a caller-specific status; None
     * means "report the original status".
     */
    using TimeoutTranslator = std::function<Optional<Status>(const Status& deadline_exceeded)>;

    /** \brief The possible states of the `then` callback latch.
     */
    enum FireState : u32 {
        kPending = 0,
        kFired = 1,
    };

    //+++++++++++-+-+--+----- --- -- -  -  -   -

    CompletionGate(const CompletionGate&) = delete;
    CompletionGate& operator=(const CompletionGate&) = delete;

    virtual ~CompletionGate() = default;

    /** \brief Returns whether the completion predicate has been observed to be true.  Never calls the
     * predicate.
     */
    bool is_finished() const noexcept
    {
        return this->finished_;
    }

    /** \brief Runs the `during` callbacks and re-checks the completion predicate; the first time the
     * predicate is observed true, runs all `then` callbacks.
     *
     * Returns true immediately (without running any callbacks) if the gate is already finished.
     *
     * If a `then` callback fails, the rest still run and the first failure is reported (a Status is
     * returned, an exception is rethrown); the gate is nevertheless finished at that point, so callers that
     * need the authoritative state after an error should check `is_finished()`.
     */
    StatusOr<bool> poll();

    /** \brief Calls `fn(args...)` once, the first time `poll` observes the predicate to be true.
     *
     * `fn` may return void, Status, or StatusOr<T>.  The arguments are copied at registration time.
     *
     * \return a GateChain referring to this gate, holding StatusCode::kFailedPrecondition if the gate is
     * already finished (in which case nothing is registered).
     */
    template <typename Fn, typename... Args>
    GateChain then(Fn&& fn, Args&&... args);

    /** \brief Calls `fn(args...)` on every poll made before the gate finishes.
     *
     * An error from a `during` callback is reported from `poll` immediately; later `during` callbacks and
     * the predicate check are skipped for that poll.
     */
    template <typename Fn, typename... Args>
    GateChain during(Fn&& fn, Args&&... args);

    /** \brief Calls `fn(args...)` each time `wait` times out, before the timeout is reported.
     */
    template <typename Fn, typename... Args>
    GateChain on_timeout(Fn&& fn, Args&&... args);

    /** \brief Sets the timeout used by `wait` when no timeout is passed explicitly.  The value is not
     * range-checked.
     */
    GateChain set_default_timeout(const Duration& timeout);

    const Optional<Duration>& default_timeout() const
    {
        return this->default_timeout_;
    }

    /** \brief Installs a hook that can replace the DeadlineExceeded status reported by `wait`.
     */
    GateChain set_timeout_translator(TimeoutTranslator&& translator);

    /** \brief Blocks until the gate finishes or the timeout elapses, using the WaitLoop passed at
     * construction.
     *
     * The effective timeout is `timeout` if given, else the default timeout, else unbounded.
     */
    Status wait(const Optional<Duration>& timeout = None);

    /** \brief Same as `wait(timeout)`, but uses `wait_loop` for this call only.
     */
    Status wait(const Optional<Duration>& timeout, WaitLoop& wait_loop);

    usize then_callback_count() const
    {
        return this->then_callbacks_.size();
    }

    usize during_callback_count() const
    {
        return this->during_callbacks_.size();
    }

    usize timeout_callback_count() const
    {
        return this->timeout_callbacks_.size();
    }

    /** \brief Prints a human-readable description of the awaited condition, for diagnostics.
     */
    virtual void print(std::ostream& out) const = 0;

   protected:
    explicit CompletionGate(WaitLoop& wait_loop = default_wait_loop()) noexcept;

    /** \brief The completion predicate.  Called on every poll until it returns true; must be cheap.
     */
    virtual bool is_condition_met() = 0;

   private:
    template <typename Fn, typename... Args>
    static Callback bind_callback(Fn&& fn, Args&&... args)
    {
        return [fn = TSTILE_FORWARD(fn), bound_args = std::make_tuple(TSTILE_FORWARD(args)...)]() mutable {
            return detail::invoke_as_status(fn, bound_args);
        };
    }

    // Returns StatusCode::kFailedPrecondition if this gate is finished (configuration is not allowed).
    //
    Status require_not_finished(const char* operation) const;

    GateChain append_callback(std::deque<Callback>& registry, Callback&& callback, const char* operation);

    Status run_then_callbacks();

    Status wait_until_done(const Optional<Duration>& timeout, WaitLoop& wait_loop, const std::string& waiting_for);

    Status run_timeout_callbacks();

    //+++++++++++-+-+--+----- --- -- -  -  -   -

    bool finished_ = false;

    // Latched to kFired when the `then` callbacks are claimed; guarantees they run at most once even if
    // `poll` is re-entered while they are running.
    //
    std::atomic<u32> fire_state_{kPending};

    // std::deque so that a running callback can register more callbacks without moving the running one.
    //
    std::deque<Callback> then_callbacks_;
    std::deque<Callback> during_callbacks_;
    std::deque<Callback> timeout_callbacks_;

    Optional<Duration> default_timeout_;
    TimeoutTranslator timeout_translator_;
    WaitLoop* wait_loop_;
};

std::ostream& operator<<(std::ostream& out, const CompletionGate& t);

/** \brief The result of configuring a CompletionGate: the gate, plus the first error of the calls made so
 * far.
 *
 * Configuration calls chain with `->`, e.g. `gate.then(f)->during(g)->on_timeout(h)`.  Once a call in the
 * chain fails, the calls after it are skipped and the chain reports that first failure, so the whole chain
 * can be checked once with `TSTILE_REQUIRE_OK` or `TSTILE_CHECK_OK`.
 */
class TSTILE_WARN_UNUSED_RESULT GateChain
{
   public:
    explicit GateChain(CompletionGate& gate, const Status& status = OkStatus()) noexcept
        : gate_{&gate}
        , status_{status}
    {
    }

    bool ok() const noexcept
    {
        return this->status_.ok();
    }

    const Status& status() const noexcept
    {
        return this->status_;
    }

    CompletionGate& gate() const noexcept
    {
        return *this->gate_;
    }

    void IgnoreError() const noexcept
    {
    }

    GateChain* operator->() noexcept
    {
        return this;
    }

    template <typename Fn, typename... Args>
    GateChain then(Fn&& fn, Args&&... args)
    {
        if (!this->ok()) {
            return *this;
        }
        return this->gate_->then(TSTILE_FORWARD(fn), TSTILE_FORWARD(args)...);
    }

    template <typename Fn, typename... Args>
    GateChain during(Fn&& fn, Args&&... args)
    {
        if (!this->ok()) {
            return *this;
        }
        return this->gate_->during(TSTILE_FORWARD(fn), TSTILE_FORWARD(args)...);
    }

    template <typename Fn, typename... Args>
    GateChain on_timeout(Fn&& fn, Args&&... args)
    {
        if (!this->ok()) {
            return *this;
        }
        return this->gate_->on_timeout(TSTILE_FORWARD(fn), TSTILE_FORWARD(args)...);
    }

    GateChain set_default_timeout(const CompletionGate::Duration& timeout)
    {
        if (!this->ok()) {
            return *this;
        }
        return this->gate_->set_default_timeout(timeout);
    }

    GateChain set_timeout_translator(CompletionGate::TimeoutTranslator&& translator)
    {
        if (!this->ok()) {
            return *this;
        }
        return this->gate_->set_timeout_translator(std::move(translator));
    }

   private:
    CompletionGate* gate_;
    Status status_;
};

inline const Status& to_status(const GateChain& chain)
{
    return chain.status();
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

template <typename Fn, typename... Args>
inline GateChain CompletionGate::then(Fn&& fn, Args&&... args)
{
    return this->append_callback(this->then_callbacks_,
                                 Self::bind_callback(TSTILE_FORWARD(fn), TSTILE_FORWARD(args)...), "then");
}

template <typename Fn, typename... Args>
inline GateChain CompletionGate::during(Fn&& fn, Args&&... args)
{
    return this->append_callback(this->during_callbacks_,
                                 Self::bind_callback(TSTILE_FORWARD(fn), TSTILE_FORWARD(args)...), "during");
}

template <typename Fn, typename... Args>
inline GateChain CompletionGate::on_timeout(Fn&& fn, Args&&... args)
{
    return this->append_callback(this->timeout_callbacks_,
                                 Self::bind_callback(TSTILE_FORWARD(fn), TSTILE_FORWARD(args)...),
                                 "on_timeout");
}

}  // namespace tstile

#endif  // TURNSTILE_ASYNC_COMPLETION_GATE_DECL_HPP
