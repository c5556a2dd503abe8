//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_UTILITY_HPP
#define TURNSTILE_UTILITY_HPP

#include <turnstile/config.hpp>
//
#include <sstream>
#include <string>
#include <utility>

/// Perfectly forward `x` without repeating its type.
///
#define TSTILE_FORWARD(x) std::forward<decltype(x)>(x)

/// Marks a type or function whose result must not be silently dropped (Status, StatusOr, GateChain).
///
#define TSTILE_WARN_UNUSED_RESULT [[nodiscard]]

/// Branch prediction hint for conditions that are almost always true (passing checks).
///
#define TSTILE_HINT_TRUE(expr) __builtin_expect(static_cast<bool>(expr), 1)

namespace tstile {

// Renders anything printable with `operator<<`; used to build gate descriptions for log lines.
//
template <typename T>
inline std::string to_string(const T& v)
{
    std::ostringstream oss;
    oss << v;
    return std::move(oss).str();
}

}  // namespace tstile

#endif  // TURNSTILE_UTILITY_HPP
