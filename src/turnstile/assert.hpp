//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2024 The Turnstile Authors
//
#pragma once
#ifndef TURNSTILE_ASSERT_HPP
#define TURNSTILE_ASSERT_HPP

#ifdef BOOST_STACKTRACE_USE_NOOP
#undef BOOST_STACKTRACE_USE_NOOP
#endif  // BOOST_STACKTRACE_USE_NOOP

#include <turnstile/config.hpp>
//
#include <turnstile/type_traits.hpp>
#include <turnstile/utility.hpp>

TSTILE_SUPPRESS_IF_GCC("-Wmaybe-uninitialized")
#include <boost/stacktrace.hpp>
TSTILE_UNSUPPRESS_IF_GCC()

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

#ifdef TSTILE_GLOG_AVAILABLE
#include <glog/logging.h>
#define TSTILE_FAIL_CHECK_OUT LOG(ERROR)
#else
#define TSTILE_FAIL_CHECK_OUT std::cerr
#endif

namespace tstile {

// Values in a failed-check message are printed as-is when they support `operator<<`; otherwise only
// their type is shown.
//
template <typename T, typename = std::enable_if_t<IsPrintable<T>{}>>
inline decltype(auto) make_printable(T&& obj)
{
    return TSTILE_FORWARD(obj);
}

template <typename T, typename = std::enable_if_t<!IsPrintable<T>{}>, typename = void>
inline std::string make_printable(T&&)
{
    return "(" + name_of<std::decay_t<T>>() + ")";
}

// Serializes concurrent check failures so their messages do not interleave.  Always returns false, so
// that it can be chained after the checked condition with `||`.
//
inline bool lock_fail_check_mutex()
{
    static std::mutex m;
    m.lock();
    return false;
}

[[noreturn]] inline void fail_check_exit()
{
    TSTILE_FAIL_CHECK_OUT << std::endl << boost::stacktrace::stacktrace{} << std::endl;
    std::abort();
}

}  // namespace tstile

// =============================================================================
// TSTILE_CHECK* abort the process with a stack trace when the condition is false; extra context can be
// streamed onto the check (`TSTILE_CHECK_LT(i, n) << "while ..."`), and is only evaluated on failure.
//
#define TSTILE_FAIL_CHECK_MESSAGE(left_str, left_val, op_str, right_str, right_val, file, line, fn_name)     \
    TSTILE_FAIL_CHECK_OUT << "FATAL: " << file << ":" << line << ": Assertion failed: " << left_str << " "   \
                          << op_str << " " << right_str << "\n (in `" << fn_name << "`)\n\n  " << left_str   \
                          << " == " << ::tstile::make_printable(left_val) << "\n  " << right_str << " == "   \
                          << ::tstile::make_printable(right_val) << "\n\n"

#define TSTILE_CHECK_RELATION(left, op, right)                                                               \
    for (; !TSTILE_HINT_TRUE(((left)op(right)) || ::tstile::lock_fail_check_mutex());                        \
         ::tstile::fail_check_exit())                                                                        \
    TSTILE_FAIL_CHECK_MESSAGE(#left, (left), #op, #right, (right), __FILE__, __LINE__, __PRETTY_FUNCTION__)

#define TSTILE_CHECK(x) TSTILE_CHECK_RELATION(bool{x}, ==, true)
#define TSTILE_CHECK_EQ(x, y) TSTILE_CHECK_RELATION(x, ==, y)
#define TSTILE_CHECK_NE(x, y) TSTILE_CHECK_RELATION(x, !=, y)
#define TSTILE_CHECK_LT(x, y) TSTILE_CHECK_RELATION(x, <, y)
#define TSTILE_CHECK_LE(x, y) TSTILE_CHECK_RELATION(x, <=, y)

// Expands to a stream insertion that prints `expr` along with its source text.
//
#define TSTILE_INSPECT(expr) " " << #expr << " == " << (expr)

#endif  // TURNSTILE_ASSERT_HPP
