//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_ASYNC_PREDICATE_GATE_HPP
#define TURNSTILE_ASYNC_PREDICATE_GATE_HPP

#include <turnstile/config.hpp>
//
#include <turnstile/async/completion_gate.hpp>
#include <turnstile/async/polling_wait_loop.hpp>

#include <turnstile/type_traits.hpp>
#include <turnstile/utility.hpp>

#include <memory>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace tstile {

// A CompletionGate whose completion predicate is an arbitrary `bool()` callable.
//
template <typename PredicateFn>
class PredicateGate : public CompletionGate
{
   public:
    static_assert(IsCallable<PredicateFn&>{}, "PredicateGate requires a callable predicate");

    explicit PredicateGate(std::string&& name, PredicateFn&& predicate_fn,
                           WaitLoop& wait_loop = default_wait_loop())
        : CompletionGate{wait_loop}
        , name_{std::move(name)}
        , predicate_fn_{std::move(predicate_fn)}
    {
    }

    const std::string& name() const
    {
        return this->name_;
    }

    void print(std::ostream& out) const override
    {
        out << "PredicateGate{" << this->name_ << "}";
    }

   protected:
    bool is_condition_met() override
    {
        return static_cast<bool>(this->predicate_fn_());
    }

   private:
    std::string name_;
    PredicateFn predicate_fn_;
};

template <typename Fn>
inline std::unique_ptr<PredicateGate<std::decay_t<Fn>>> make_predicate_gate(std::string name, Fn&& fn)
{
    return std::make_unique<PredicateGate<std::decay_t<Fn>>>(std::move(name),
                                                             std::decay_t<Fn>(TSTILE_FORWARD(fn)));
}

template <typename Fn>
inline std::unique_ptr<PredicateGate<std::decay_t<Fn>>> make_predicate_gate(std::string name, Fn&& fn,
                                                                            WaitLoop& wait_loop)
{
    return std::make_unique<PredicateGate<std::decay_t<Fn>>>(
        std::move(name), std::decay_t<Fn>(TSTILE_FORWARD(fn)), wait_loop);
}

}  // namespace tstile

#endif  // TURNSTILE_ASYNC_PREDICATE_GATE_HPP
