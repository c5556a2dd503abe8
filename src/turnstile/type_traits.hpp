//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_TYPE_TRAITS_HPP
#define TURNSTILE_TYPE_TRAITS_HPP

#include <boost/core/demangle.hpp>

#include <ostream>
#include <string>
#include <type_traits>
#include <typeinfo>

namespace tstile {

// std::true_type if `Fn` can be called with `Args...`.
//
template <typename Fn, typename... Args>
using IsCallable = std::is_invocable<Fn, Args...>;

namespace detail {

template <typename T, typename = decltype(std::declval<std::ostream&>() << std::declval<T>())>
std::true_type is_printable_impl(int);

template <typename T>
std::false_type is_printable_impl(...);

}  // namespace detail

// std::true_type if a `T` can be written to a std::ostream.
//
template <typename T>
using IsPrintable = decltype(detail::is_printable_impl<T>(0));

// The demangled name of `T`, for diagnostics.
//
template <typename T>
inline std::string name_of()
{
    return boost::core::demangle(typeid(T).name());
}

}  // namespace tstile

#endif  // TURNSTILE_TYPE_TRAITS_HPP
