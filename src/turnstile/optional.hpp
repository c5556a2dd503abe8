//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_OPTIONAL_HPP
#define TURNSTILE_OPTIONAL_HPP

#include <boost/optional.hpp>
#include <boost/optional/optional_io.hpp>

namespace tstile {

// Optional timeouts, translator results and StatusOr values all use Boost.Optional (which, unlike
// std::optional, also holds references).
//
template <typename T>
using Optional = boost::optional<T>;

inline const boost::none_t& None = boost::none;

}  // namespace tstile

#endif  // TURNSTILE_OPTIONAL_HPP
